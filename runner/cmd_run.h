#pragma once

// reviser_cli run <target_dir> [--workers N] [--max_iterations N]
int cmd_run(int argc, char** argv);

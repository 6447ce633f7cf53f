#pragma once

// Single-step commands over the sandbox, no collaborators involved.
int cmd_list(int argc, char** argv); // reviser_cli list <dir>
int cmd_lint(int argc, char** argv); // reviser_cli lint <file>
int cmd_test(int argc, char** argv); // reviser_cli test <file>

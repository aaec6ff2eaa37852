#pragma once

// warden_cli subcommands. Each returns the process exit code.

int cmd_run(int argc, char** argv);
int cmd_submit(int argc, char** argv);
int cmd_status(int argc, char** argv);
int cmd_audit(int argc, char** argv);
int cmd_verify(int argc, char** argv);
int cmd_recover(int argc, char** argv);
int cmd_check_policy(int argc, char** argv);

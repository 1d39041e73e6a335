/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */

#ifndef SRC_MAIN_TOOLS_TINYCAGE_API_C_H_
#define SRC_MAIN_TOOLS_TINYCAGE_API_C_H_

#include <sys/types.h>

#if defined(__cplusplus)
extern "C" {
#endif

typedef struct tinycage_sandbox tinycage_sandbox;
typedef struct tinycage_child tinycage_child;

#define TINYCAGE_STDIO_INHERIT 0
#define TINYCAGE_STDIO_NULL 1
#define TINYCAGE_STDIO_PIPED 2

// A sandbox starts with nothing granted. Returns NULL on allocation failure.
tinycage_sandbox* tinycage_sandbox_new();
void tinycage_sandbox_free(tinycage_sandbox* sandbox);

// Grants. All of them return 0 or a negative value, in which case the last
// error code and message tell what went wrong.
int tinycage_allow_read(tinycage_sandbox* sandbox, const char* path);
int tinycage_allow_write(tinycage_sandbox* sandbox, const char* path);
int tinycage_allow_execute(tinycage_sandbox* sandbox, const char* path);
int tinycage_allow_networking(tinycage_sandbox* sandbox);

// `env` is a NULL terminated array of "NAME=VALUE" strings. Only one custom
// environment can be set per sandbox.
int tinycage_set_environment(tinycage_sandbox* sandbox, const char* const* env);

int tinycage_set_implicit_library_reads(tinycage_sandbox* sandbox, int enabled);
int tinycage_set_staging_directory(tinycage_sandbox* sandbox, const char* path);

// Runs `program` with the NULL terminated `argv`, argv[0] included. With a
// NULL `argv`, or a NULL or empty argv[0], the target sees `program` as
// argv[0]. `working_dir` may be NULL. On success stores a new handle in
// `*child`.
int tinycage_spawn(tinycage_sandbox* sandbox, const char* program, const char* const* argv,
                   const char* working_dir, int stdin_mode, int stdout_mode, int stderr_mode,
                   tinycage_child** child);

pid_t tinycage_child_pid(const tinycage_child* child);
int tinycage_child_stdin(const tinycage_child* child);
int tinycage_child_stdout(const tinycage_child* child);
int tinycage_child_stderr(const tinycage_child* child);

// Stores the exit code, or 128 + signal, in `*exit_code`.
int tinycage_child_wait(tinycage_child* child, int* exit_code);
int tinycage_child_kill(tinycage_child* child);
int tinycage_child_signal(tinycage_child* child, int signum);
void tinycage_child_free(tinycage_child* child);

// Enables logging at a certain path. The parent folder has to exist
int tinycage_enable_log(const char* path);

// Returns error code, error messages and the errno of the last error
int tinycage_get_last_error_code();
const char* tinycage_get_last_error_msg();
int tinycage_get_last_error_errno();

#if defined(__cplusplus)
}
#endif

#endif  // SRC_MAIN_TOOLS_TINYCAGE_API_C_H_

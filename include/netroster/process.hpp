/**
 * @file process.hpp
 * @brief Run an external tool, capture its output, and kill it on deadline.
 *
 * @details
 * PURPOSE
 * -------
 * Both probe backends are process wrappers: build an argv, run the tool,
 * parse stdout. This header is the one place that knows how to do that on
 * Linux: fork/execvp, pipes, a poll(2) loop bounded by the ScanContext, and
 * signal-based teardown.
 *
 * TEARDOWN
 * --------
 * The child is put in its own process group. When the context expires the
 * whole group gets SIGTERM, then SIGKILL after a short grace period, and is
 * reaped before run_process() returns. Nothing is left running after the
 * caller gives up.
 *
 * EXAMPLE
 * -------
 * @code
 *   netroster::ScanContext ctx(std::chrono::seconds(5));
 *   netroster::ProcessResult r;
 *   std::string err;
 *   if (!netroster::run_process({"/bin/echo", "hi"}, ctx, r, err)) {
 *       // timed out / cancelled / could not start
 *   } else if (r.exit_code != 0) {
 *       // tool ran and failed; r.err_output has its stderr
 *   }
 * @endcode
 */
#pragma once
#include <string>
#include <vector>

#include "netroster/scan_context.hpp"

namespace netroster {

struct ProcessResult {
    int exit_code{-1};        /**< Exit status, or 128+signal if killed by a signal. */
    std::string output;       /**< Everything the child wrote to stdout. */
    std::string err_output;   /**< Everything the child wrote to stderr. */
};

/**
 * @brief Resolve an executable the way a shell would.
 *
 * A name containing '/' is checked as a path; anything else is searched for
 * in $PATH (or "/usr/local/bin:/usr/bin:/bin" when PATH is unset).
 *
 * @return absolute or as-given path of an executable file, or empty if none.
 */
std::string find_executable(const std::string& name);

/**
 * @brief Run argv[0] with argv, capturing stdout/stderr.
 *
 * @return true if the child ran to completion (any exit code; see
 *         @p result.exit_code). false if it could not be started, or if
 *         @p ctx expired first; @p err is then "cancelled" or "timed out"
 *         and the child has already been killed and reaped.
 */
bool run_process(const std::vector<std::string>& argv,
                 const ScanContext& ctx,
                 ProcessResult& result,
                 std::string& err);

} // namespace netroster

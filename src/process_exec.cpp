#include "lob/process_exec.hpp"

#include "lob/utility.hpp"

#include <format>
#include <optional>
#include <reproc++/drain.hpp>
#include <reproc++/run.hpp>
#include <string>
#include <utility>
#include <vector>

namespace lob {

namespace {

Error start_error(const std::vector<std::string> &args, const std::error_code &ec) {
    return Error::io(std::format("Failed to execute {}: {}", args.front(), ec.message()));
}

} // namespace

Result<int> process_exec(std::vector<std::string> &&args, std::optional<std::string> working_dir) {
    if (args.empty()) {
        return std::unexpected(Error::io("Cannot execute empty command"));
    }

    reproc::options options;
    options.redirect.in.type = reproc::redirect::parent;
    options.redirect.out.type = reproc::redirect::parent;
    options.redirect.err.type = reproc::redirect::parent;

    if (working_dir) {
        options.working_directory = working_dir->c_str();
    }

    auto [status, ec] = reproc::run(args, options);

    if (ec)
        return std::unexpected(start_error(args, ec));
    return status;
}

Result<ProcessOutput> process_capture(std::vector<std::string> &&args, std::optional<std::string> working_dir) {
    if (args.empty()) {
        return std::unexpected(Error::io("Cannot execute empty command"));
    }

    reproc::options options;
    options.redirect.in.type = reproc::redirect::discard;

    if (working_dir) {
        options.working_directory = working_dir->c_str();
    }

    ProcessOutput output;
    reproc::sink::string out_sink(output.out);
    reproc::sink::string err_sink(output.err);

    auto [status, ec] = reproc::run(args, options, out_sink, err_sink);

    if (ec)
        return std::unexpected(start_error(args, ec));
    output.status = status;
    return output;
}

Result<int> process_quiet(std::vector<std::string> &&args) {
    if (args.empty()) {
        return std::unexpected(Error::io("Cannot execute empty command"));
    }

    reproc::options options;
    options.redirect.in.type = reproc::redirect::discard;
    options.redirect.out.type = reproc::redirect::discard;
    options.redirect.err.type = reproc::redirect::discard;

    auto [status, ec] = reproc::run(args, options);

    if (ec)
        return std::unexpected(start_error(args, ec));
    return status;
}

} // namespace lob

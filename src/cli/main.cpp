// envinject: patch placeholder tokens in built static assets with values from
// the container environment, then hand over to the web server.
//
//     envinject --root /usr/share/nginx/html --strict -- nginx -g 'daemon off;'
//
// The server command only runs after a successful pass, so it never serves a
// file that is mid-rewrite or still carries placeholders.

#include <envinject/cli.hpp>
#include <envinject/log.hpp>

#include <iostream>
#include <string>
#include <vector>

using namespace envinject;

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);

    auto parsed = parse_args(args);
    if (parsed.is_err()) {
        log::error("%s", parsed.error().format().c_str());
        return parsed.error().exit_code();
    }
    const CliOptions& opts = parsed.value();

    if (opts.show_help) {
        std::cout << usage();
        return 0;
    }
    if (opts.show_version) {
        std::cout << "envinject " << version() << "\n";
        return 0;
    }

    // Read once; later changes to the environment do not affect this run
    auto env = EnvironmentSnapshot::capture();

    int code = run_injection(opts, env);
    if (code != 0 || opts.command.empty()) {
        return code;
    }

    auto status = exec_command(opts.command);
    if (status.is_err()) {
        log::error("%s", status.error().format().c_str());
    }
    return 127;
}

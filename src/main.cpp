#include "glua/glua.hpp"

#include <cstdlib>
#include <iostream>
#include <iterator>
#include <sstream>

using namespace glua;

void show_usage() {
    std::cout <<
        "Usage: glua [options] [PATH | -]\n"
        "Description:\n"
        "  Run a Lua script through the glua embedding layer and print the\n"
        "  values it returns, one per line.\n"
        "Options/Arguments:\n"
        "  -h            Show this help message and exit.\n"
        "  -e code       Run code instead of a file.\n"
        "  -I dir        Add a package search directory. Can occur multiple times.\n"
        "  -q            Do not log informational messages.\n"
        "  -             Take source directly from STDIN.\n"
        "  FILE          File to run.\n"
        "Directories in the colon-separated GLUA_PATH environment variable are\n"
        "searched after those given with -I.\n"
        ;
}

struct driver_options {
    // file to run. Empty together with stdin_flag means stdin.
    string src = "";
    // inline code given with -e
    string code = "";
    bool has_code = false;
    bool stdin_flag = false;
    // if true, show help and exit
    bool help = false;
    bool quiet = false;
    // package include directories
    std::vector<string> include;

    // if true, the argument list was malformed and the other fields are not
    // guaranteed to be properly initialized
    bool err = false;
    string message = "";
};

// fill in a driver_options object based on CLI options. Sets opt->err on
// malformed command line arguments.
void process_args(int argc, char** argv, driver_options* opt) {
    int i;
    for (i = 1; i < argc; ++i) {
        string s{argv[i]};
        if (s[0] == '-') {
            switch(s[1]) {
            case 'h':
                opt->help = true;
                if (s[2] != '\0') {
                    opt->err = true;
                    opt->message = "Unrecognized option: " + s;
                }
                // no sense doing further processing at this point
                return;
            case 'q':
                opt->quiet = true;
                if (s[2] != '\0') {
                    opt->err = true;
                    opt->message = "Unrecognized option: " + s;
                    return;
                }
                break;
            case 'e':
                if (opt->has_code) {
                    opt->err = true;
                    opt->message = "Multiple -e options.";
                    return;
                }
                // can have -e code or -ecode syntax
                if (s[2] == '\0') {
                    if (i == argc - 1) {
                        opt->err = true;
                        opt->message = "Option -e requires an argument.";
                        return;
                    }
                    opt->code = argv[++i];
                } else {
                    opt->code = s.substr(2);
                }
                opt->has_code = true;
                break;
            case 'I':
                if (s[2] != '\0') {
                    opt->include.push_back(s.substr(2));
                } else if (i == argc - 1) {
                    opt->err = true;
                    opt->message = "Option -I requires an argument.";
                    return;
                } else {
                    opt->include.push_back(argv[++i]);
                }
                break;
            case '\0':
                opt->stdin_flag = true;
                break;
            default:
                opt->err = true;
                opt->message = "Unrecognized option: " + s;
                return;
            }
        } else {
            // filename
            if (opt->stdin_flag || opt->src != "") {
                opt->err = true;
                opt->message = "Multiple input sources provided.";
                return;
            }
            opt->src = s;
        }
    }
    int sources = (opt->src != "") + opt->stdin_flag + opt->has_code;
    if (sources > 1) {
        opt->err = true;
        opt->message = "Multiple input sources provided.";
    } else if (sources == 0) {
        opt->err = true;
        opt->message = "No input provided.";
    }
}

// split a colon-separated list of directories, skipping empty entries
static std::vector<string> split_path(const string& s) {
    std::vector<string> res;
    std::istringstream in{s};
    string dir;
    while (std::getline(in, dir, ':')) {
        if (!dir.empty()) {
            res.push_back(dir);
        }
    }
    return res;
}

int main(int argc, char** argv) {
    driver_options opt;
    process_args(argc, argv, &opt);
    if (opt.help) {
        show_usage();
        return 0;
    } else if (opt.err) {
        std::cout << "Error processing command line arguments:\n  "
                  << opt.message << '\n';
        return -1;
    }

    logger log{&std::cerr, opt.quiet ? nullptr : &std::cerr};
    vm_options vopt;
    vopt.log = &log;
    vopt.package_path = opt.include;
    if (auto env = std::getenv("GLUA_PATH")) {
        for (auto& dir : split_path(env)) {
            vopt.package_path.push_back(dir);
        }
    }

    auto S = init(vopt);
    optional<result<step<value_list>>> res;
    if (opt.has_code) {
        res.emplace(run(std::move(S), opt.code));
    } else if (opt.stdin_flag) {
        string src{std::istreambuf_iterator<char>{std::cin},
            std::istreambuf_iterator<char>{}};
        res.emplace(run(std::move(S), src));
    } else {
        res.emplace(run_file(std::move(S), opt.src));
    }

    if (!*res) {
        // the failure itself was already logged by the state
        auto& err = res->error();
        if (err.is<runtime_error>()) {
            std::cerr << err.as<runtime_error>().traceback << '\n';
        }
        return 1;
    }
    for (auto& v : res->get().out) {
        std::cout << to_string(v) << '\n';
    }
    return 0;
}

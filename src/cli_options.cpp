#include "cli_options.hpp"

#include <sstream>
#include <vector>

#include "errors.hpp"

namespace autocorrect {

CliOptions parse_cli_options(int argc, const char* const argv[]) {
    CliOptions opts;
    std::vector<std::string> args(argv + 1, argv + argc);

    for (size_t i = 0; i < args.size(); i++) {
        std::string flag = args[i];
        std::optional<std::string> inline_value;
        size_t eq = flag.find('=');
        if (flag.rfind("--", 0) == 0 && eq != std::string::npos) {
            inline_value = flag.substr(eq + 1);
            flag = flag.substr(0, eq);
        }

        auto value = [&]() -> std::string {
            if (inline_value) return *inline_value;
            if (i + 1 >= args.size()) throw InvalidArgument("missing value for " + flag);
            return args[++i];
        };

        if (flag == "--help" || flag == "-h") {
            opts.help = true;
        } else if (flag == "--lemmatize") {
            opts.lemmatize = true;
        } else if (flag == "--dataset" || flag == "-d") {
            opts.dataset = fs::path(value());
        } else if (flag == "--vocab") {
            opts.vocab = fs::path(value());
        } else if (flag == "--env") {
            opts.env_file = fs::path(value());
        } else if (flag == "--k" || flag == "-k") {
            std::string v = value();
            try {
                opts.k = parse_positive_int("--k", v);
            } catch (const ConfigurationError& e) {
                throw InvalidArgument(e.what());
            }
        } else {
            throw InvalidArgument("unknown option: " + args[i]);
        }
    }
    return opts;
}

void apply_cli_options(const CliOptions& opts, AppConfig& cfg) {
    if (opts.dataset) {
        cfg.dataset = *opts.dataset;
        // An explicit corpus on the command line beats a configured table
        if (!opts.vocab) cfg.vocab.clear();
    }
    if (opts.vocab) cfg.vocab = *opts.vocab;
    if (opts.k) cfg.k = *opts.k;
    if (opts.lemmatize) cfg.lemmatize = true;
}

std::string cli_usage(const std::string& program) {
    std::ostringstream ss;
    ss << "Usage: " << program << " [--dataset PATH] [--vocab PATH] [--k N] [--lemmatize] [--env PATH]\n"
       << "  -d, --dataset PATH  text corpus to learn word frequencies from (default final.txt)\n"
       << "      --vocab PATH    JSON frequency table written by vocab_builder\n"
       << "  -k, --k N           number of suggestions to print (default 3)\n"
       << "      --lemmatize     reduce the input word to its base form first\n"
       << "      --env PATH      settings file (default .env)\n"
       << "  -h, --help          show this message\n";
    return ss.str();
}

} // namespace autocorrect

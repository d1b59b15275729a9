#include <iostream>
#include <string>

#include "api_engine.hpp"
#include "cli_options.hpp"
#include "config.hpp"
#include "env_loader.hpp"
#include "errors.hpp"
#include "textutil.hpp"
#include "vocab_io.hpp"

using namespace autocorrect;

int main(int argc, char** argv) {

    // Flags first, then .env + environment for everything left unset
    CliOptions opts;
    AppConfig cfg;
    try {
        opts = parse_cli_options(argc, argv);
        if (opts.help) {
            std::cout << cli_usage(argv[0]);
            return 0;
        }
        cfg = load_app_config(load_env_with_overrides(opts.env_file, kConfigKeys));
        apply_cli_options(opts, cfg);
    } catch (const InvalidArgument& e) {
        std::cerr << "[error] " << e.what() << "\n" << cli_usage(argv[0]);
        return 2;
    } catch (const ConfigurationError& e) {
        std::cerr << "[config] " << e.what() << "\n";
        return 1;
    }

    // Load corpus or frequency table and build the pipeline
    std::shared_ptr<const Suggester> suggester;
    try {
        auto vocab = load_vocabulary_source(cfg);
        if (vocab->empty()) {
            std::cerr << "[error] Dataset appears to be empty after processing.\n";
            return 1;
        }
        suggester = build_suggester(cfg, vocab);
    } catch (const ConfigurationError& e) {
        std::cerr << "[error] " << e.what() << "\n";
        if (cfg.vocab.empty()) {
            std::cerr << "Create " << cfg.dataset << " with lots of correctly spelled text "
                      << "(news articles, books, etc.) and rerun.\n";
        }
        return 1;
    }

    std::cout << "\nAutocorrector ready. Type a word to get suggestions. Type 'exit' to quit.\n\n";

    std::string line;
    while (true) {
        std::cout << "Enter a word: " << std::flush;
        if (!std::getline(std::cin, line)) {
            std::cout << "\n";
            break;
        }

        std::string input = case_fold(line);
        if (input == "exit" || input == "quit") break;

        if (!is_lower_alpha(input)) {
            std::cout << "Please enter only alphabetic characters (a-z).\n\n";
            continue;
        }

        auto suggestions = suggester->suggest(input, cfg.k);
        if (suggestions.empty()) {
            std::cout << "(No suggestions found)\n";
            continue;
        }

        std::cout << "Top suggestions: ";
        for (size_t i = 0; i < suggestions.size(); i++) {
            if (i) std::cout << ", ";
            std::cout << suggestions[i].word;
        }
        std::cout << "\n";
    }

    std::cout << "Goodbye!\n";
    return 0;
}

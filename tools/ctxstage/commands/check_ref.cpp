/**
 * ctxstage CLI - check-ref command
 *
 * Validate image references ([HOST[:PORT]/]PATH[:TAG]).
 */

#include "../common.hpp"
#include <ctxstage/image_ref.hpp>
#include <CLI/CLI.hpp>

namespace ctxstage::cli::commands {

namespace {

struct CheckRefOptions {
    std::vector<std::string> references;
};

int cmd_check_ref(const GlobalOptions& opts, const CheckRefOptions& check_opts) {
    init_warning_collector(opts.json);

    bool all_valid = true;
    nlohmann::json results = nlohmann::json::array();

    for (const auto& ref : check_opts.references) {
        bool valid = is_valid_image_reference(ref);
        all_valid = all_valid && valid;

        if (opts.json) {
            results.push_back({{"reference", ref}, {"valid", valid}});
        } else if (valid) {
            if (!opts.quiet) {
                std::cout << "valid    " << ref << std::endl;
            }
        } else {
            std::cout << "invalid  " << ref << std::endl;
        }
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = all_valid;
        j["references"] = results;
        output_json(j);
    }

    return all_valid ? 0 : 1;
}

} // namespace

void setup_check_ref(CLI::App* app, GlobalOptions& opts) {
    static CheckRefOptions check_opts;

    app->add_option("references", check_opts.references, "Image references")->required();

    app->callback([&opts]() {
        std::exit(cmd_check_ref(opts, check_opts));
    });
}

} // namespace ctxstage::cli::commands

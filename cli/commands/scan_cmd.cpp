//
// Created by gregorian-rayne on 10/19/26.
//

#include "dsv/cli/commands/command.hpp"
#include "dsv/cli/formatter.hpp"

#include "dsv/dsv.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace dsv::cli {

    namespace fs = std::filesystem;

    /**
     * Scan command - reports declared dependencies nothing uses.
     */
    class ScanCommand : public Command {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "scan";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Find declared dependencies that no file, script or package uses";
        }

        [[nodiscard]] std::string usage() const override {
            return "Usage: depsieve scan [OPTIONS] [project-dir]\n"
                   "\n"
                   "Examples:\n"
                   "  depsieve scan\n"
                   "  depsieve scan --safe husky --safe lint-staged apps/web\n"
                   "  depsieve scan --ignore 'dist/**' --json --output unused.json";
        }

        [[nodiscard]] std::vector<ArgDef> arguments() const override {
            return {
                {"config", 'c', "Configuration file (default: <project>/.depsieve.toml)", false, true, "", "FILE"},
                {"safe", 's', "Never report this dependency (comma list)", false, true, "", "NAME", true},
                {"ignore", 'i', "Skip files matching this glob (comma list)", false, true, "", "GLOB", true},
                {"aggressive", 0, "Also report unused protected dependencies", false, false, "", ""},
                {"no-gitignore", 0, "Do not apply .gitignore patterns", false, false, "", ""},
                {"jobs", 'j', "Number of worker threads (0 = auto)", false, true, "", "N"},
                {"batch-size", 0, "Fixed files per batch instead of adaptive sizing", false, true, "", "N"},
                {"stats", 0, "Print cache and timing statistics", false, false, "", ""},
                {"evidence", 'e', "Print the evidence collected for every dependency", false, false, "", ""},
                {"output", 'o', "Also write the JSON report to this file", false, true, "", "FILE"},
                {"no-color", 0, "Disable colored output", false, false, "", ""},
            };
        }

        [[nodiscard]] std::string validate(const ParsedArgs& args) const override {
            if (args.positional().size() > 1) {
                return "Only one project directory may be given";
            }
            for (const auto* name : {"jobs", "batch-size"}) {
                if (auto count = args.get_count(name); count.is_err()) {
                    return count.error().message();
                }
            }
            return "";
        }

        [[nodiscard]] int execute(const ParsedArgs& args) override {
            if (args.get_flag("help")) {
                print_help();
                return 0;
            }

            configure_output(args);

            if (args.get_flag("no-color")) {
                colors::set_enabled(false);
            }

            const fs::path project_dir = args.positional().empty() ? fs::path(".") : fs::path(args.positional().front());

            std::error_code ec;
            if (!fs::is_directory(project_dir, ec)) {
                print_error("Not a directory: " + project_dir.string());
                return 1;
            }

            auto options = load_options(args, project_dir);
            if (options.is_err()) {
                print_error(options.error().to_string());
                return 1;
            }

            print_verbose("Analyzing " + fs::absolute(project_dir, ec).string());

            analysis::DependencyAnalyzer analyzer(std::move(options).value());
            auto result = analyzer.analyze(project_dir);
            if (result.is_err()) {
                print_error(result.error().to_string());
                return 1;
            }

            const auto& report = result.value();
            print_debug("Analysis root: " + report.project_root.string());
            print_debug("Manifest: " + report.manifest_path.string());

            const bool with_stats = args.get_flag("stats");

            if (is_json()) {
                std::cout << analysis::to_json(report, with_stats).dump(2) << "\n";
            } else if (!is_quiet()) {
                ReportPrinter printer(std::cout);
                printer.print_summary(report);
                printer.print_unused(report);
                printer.print_kept(report);
                if (args.get_flag("evidence")) {
                    printer.print_evidence(report);
                }
                if (with_stats) {
                    printer.print_statistics(report.stats);
                }
                if (is_verbose()) {
                    printer.print_diagnostics(report.diagnostics);
                }
            } else {
                for (const auto& name : report.unused) {
                    std::cout << name << "\n";
                }
            }

            if (!report.diagnostics.empty() && !is_verbose() && !is_json()) {
                print_warning(std::to_string(report.diagnostics.size()) +
                              " problems were skipped during analysis (use --verbose to list them)");
            }

            if (auto output_file = args.get("output")) {
                std::ofstream out(*output_file);
                if (!out) {
                    print_error("Failed to open output file: " + *output_file);
                    return 1;
                }
                out << analysis::to_json(report, with_stats).dump(2) << "\n";
                print_verbose("Report written to " + *output_file);
            }

            return 0;
        }

    private:
        /**
         * Configuration file values first, then command line overrides.
         */
        [[nodiscard]] Result<AnalysisOptions> load_options(const ParsedArgs& args, const fs::path& project_dir) const {
            AnalysisOptions options;
            core::Config config;

            std::optional<fs::path> config_path;
            if (auto explicit_path = args.get("config")) {
                config_path = fs::path(*explicit_path);
            } else if (auto manifest = manifest::find_manifest(project_dir); manifest.is_ok()) {
                config_path = core::Config::find_in(manifest.value().parent_path());
            }

            if (config_path) {
                auto loaded = core::Config::load_from_file(*config_path);
                if (loaded.is_err()) {
                    return Result<AnalysisOptions>::failure(loaded.error());
                }
                config = std::move(loaded).value();
                print_verbose("Using configuration " + config_path->string());
            }
            config.apply_to(options);

            for (auto& name : args.get_all("safe")) {
                if (std::ranges::find(options.safe_dependencies, name) == options.safe_dependencies.end()) {
                    options.safe_dependencies.push_back(std::move(name));
                }
            }
            for (auto& pattern : args.get_all("ignore")) {
                options.ignore_patterns.push_back(std::move(pattern));
            }
            if (args.get_flag("aggressive")) {
                options.aggressive = true;
            }
            if (args.get_flag("no-gitignore")) {
                options.use_gitignore = false;
            }
            auto jobs = args.get_count("jobs");
            if (jobs.is_err()) {
                return Result<AnalysisOptions>::failure(jobs.error());
            }
            if (jobs.value()) {
                options.performance.jobs = *jobs.value();
            }

            auto batch = args.get_count("batch-size");
            if (batch.is_err()) {
                return Result<AnalysisOptions>::failure(batch.error());
            }
            if (batch.value()) {
                options.performance.fixed_batch_size = *batch.value();
            }

            return Result<AnalysisOptions>::success(std::move(options));
        }
    };

    namespace {
        struct ScanCommandRegistrar {
            ScanCommandRegistrar() {
                CommandRegistry::instance().register_command(
                    std::make_unique<ScanCommand>()
                );
            }
        } scan_registrar;
    }
}  // namespace dsv::cli

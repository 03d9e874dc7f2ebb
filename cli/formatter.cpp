//
// Created by gregorian-rayne on 10/19/26.
//

#include "dsv/cli/formatter.hpp"
#include "dsv/analysis/protected_dependencies.hpp"
#include "dsv/utils/string_utils.hpp"

#include <algorithm>
#include <cstdio>
#include <iomanip>
#include <sstream>

#ifdef _WIN32
#include <io.h>
#else
#include <unistd.h>
#endif

namespace dsv::cli {

    // ============================================================================
    // Colors
    // ============================================================================

    namespace colors {

        static bool g_colors_enabled = true;

        const char* RESET = "\033[0m";
        const char* BOLD = "\033[1m";
        const char* DIM = "\033[2m";

        const char* RED = "\033[31m";
        const char* GREEN = "\033[32m";
        const char* YELLOW = "\033[33m";
        const char* CYAN = "\033[36m";

        bool enabled() {
            return g_colors_enabled && is_tty();
        }

        void set_enabled(const bool enable) {
            g_colors_enabled = enable;
        }

    }  // namespace colors

    bool is_tty() {
#ifdef _WIN32
        return _isatty(_fileno(stdout)) != 0;
#else
        return isatty(fileno(stdout)) != 0;
#endif
    }

    namespace {

        std::string paint(const char* color, const std::string_view text) {
            if (!colors::enabled()) {
                return std::string(text);
            }
            return std::string(color) + std::string(text) + colors::RESET;
        }

        std::string joined(const std::set<std::string>& values, const std::size_t limit) {
            std::vector<std::string> shown;
            for (const auto& v : values) {
                if (shown.size() == limit) {
                    shown.push_back("+" + std::to_string(values.size() - limit) + " more");
                    break;
                }
                shown.push_back(v);
            }
            return string_utils::join(shown, ", ");
        }

    }  // namespace

    // ============================================================================
    // Formatting Functions
    // ============================================================================

    std::string format_duration(const Duration d) {
        auto ns = d.count();
        if (ns < 0) ns = 0;

        const auto us = ns / 1000;
        const auto ms = us / 1000;
        const auto seconds = ms / 1000;

        std::ostringstream ss;
        if (seconds > 0) {
            ss << seconds << "." << std::setfill('0') << std::setw(2) << ((ms % 1000) / 10) << "s";
        } else if (ms > 0) {
            ss << ms << "." << ((us % 1000) / 100) << "ms";
        } else if (us > 0) {
            ss << us << "us";
        } else {
            ss << ns << "ns";
        }
        return ss.str();
    }

    std::string format_count(const std::size_t count) {
        std::string result = std::to_string(count);

        int insert_pos = static_cast<int>(result.length()) - 3;
        while (insert_pos > 0) {
            result.insert(static_cast<std::size_t>(insert_pos), ",");
            insert_pos -= 3;
        }
        return result;
    }

    std::string format_percent(const double ratio) {
        std::ostringstream ss;
        ss << std::fixed << std::setprecision(1) << (ratio * 100.0) << "%";
        return ss.str();
    }

    // ============================================================================
    // Table Implementation
    // ============================================================================

    Table::Table(std::vector<Column> columns)
        : columns_(std::move(columns)) {}

    void Table::add_row(Row row) {
        while (row.size() < columns_.size()) {
            row.emplace_back("");
        }
        rows_.push_back(std::move(row));
    }

    std::vector<std::size_t> Table::widths() const {
        std::vector<std::size_t> out;
        out.reserve(columns_.size());
        for (std::size_t i = 0; i < columns_.size(); ++i) {
            if (columns_[i].width != 0) {
                out.push_back(columns_[i].width);
                continue;
            }
            std::size_t max_width = columns_[i].header.length();
            for (const auto& row : rows_) {
                max_width = std::max(max_width, row[i].length());
            }
            out.push_back(max_width);
        }
        return out;
    }

    std::string Table::render() const {
        std::ostringstream ss;
        render(ss);
        return ss.str();
    }

    void Table::render(std::ostream& out) const {
        const auto column_widths = widths();

        auto render_row = [&](const Row& row, const bool is_header) {
            for (std::size_t i = 0; i < columns_.size(); ++i) {
                const std::size_t width = column_widths[i];
                std::string cell = row[i];

                if (cell.length() > width && width > 3) {
                    cell = cell.substr(0, width - 3) + "...";
                }

                if (is_header && colors::enabled()) {
                    out << colors::BOLD;
                }
                if (columns_[i].right_align) {
                    out << std::right << std::setw(static_cast<int>(width)) << cell;
                } else {
                    out << std::left << std::setw(static_cast<int>(width)) << cell;
                }
                if (is_header && colors::enabled()) {
                    out << colors::RESET;
                }

                if (i < columns_.size() - 1) {
                    out << "  ";
                }
            }
            out << "\n";
        };

        Row header;
        for (const auto& col : columns_) {
            header.push_back(col.header);
        }
        render_row(header, true);

        for (std::size_t i = 0; i < columns_.size(); ++i) {
            out << std::string(column_widths[i], '-');
            if (i < columns_.size() - 1) {
                out << "--";
            }
        }
        out << "\n";

        for (const auto& row : rows_) {
            render_row(row, false);
        }
    }

    // ============================================================================
    // ReportPrinter Implementation
    // ============================================================================

    ReportPrinter::ReportPrinter(std::ostream& out)
        : out_(out) {}

    void ReportPrinter::heading(const std::string_view title) const {
        out_ << "\n";
        if (colors::enabled()) {
            out_ << colors::BOLD << title << colors::RESET << "\n";
        } else {
            out_ << title << "\n";
        }
        out_ << std::string(60, '=') << "\n";
    }

    void ReportPrinter::print_summary(const analysis::AnalysisReport& report) const {
        heading("Dependency Summary");

        out_ << "Project:              " << report.project_root.string() << "\n";
        if (report.workspace_manifest) {
            out_ << "Workspace manifest:   " << report.workspace_manifest->string() << "\n";
        }
        out_ << "Files scanned:        " << format_count(report.stats.files_scanned) << "\n";
        out_ << "Declared:             " << format_count(report.declared.size()) << "\n";
        out_ << "Unused:               " << format_count(report.unused.size()) << "\n";
        if (!report.protected_unused.empty()) {
            out_ << "Protected (unused):   " << format_count(report.protected_unused.size()) << "\n";
        }
        if (!report.safe_unused.empty()) {
            out_ << "Safe-listed (unused): " << format_count(report.safe_unused.size()) << "\n";
        }
        out_ << "Analysis time:        " << format_duration(report.stats.analysis_duration) << "\n";
    }

    void ReportPrinter::print_unused(const analysis::AnalysisReport& report) const {
        if (report.unused.empty()) {
            out_ << "\n" << paint(colors::GREEN, "No unused dependencies found.") << "\n";
            return;
        }

        heading("Unused Dependencies");

        Table table({
            {"Package", 0, false},
            {"Section", 0, false},
            {"Version", 0, false},
        });
        for (const auto& name : report.unused) {
            const auto it = std::ranges::find_if(report.declared, [&](const DeclaredDependency& dep) {
                return dep.name == name;
            });
            if (it == report.declared.end()) {
                table.add_row({name, "", ""});
            } else {
                table.add_row({name, to_string(it->kind), it->version_range});
            }
        }
        table.render(out_);
    }

    void ReportPrinter::print_kept(const analysis::AnalysisReport& report) const {
        if (!report.protected_unused.empty()) {
            heading("Unused but Protected");
            for (const auto& name : report.protected_unused) {
                out_ << "  " << paint(colors::YELLOW, name);
                if (const auto reason = analysis::protection_reason(name)) {
                    out_ << paint(colors::DIM, " (" + *reason + ")");
                }
                out_ << "\n";
            }
            out_ << paint(colors::DIM, "Pass --aggressive to list these as removable.") << "\n";
        }

        if (!report.safe_unused.empty()) {
            heading("Unused but Safe-listed");
            for (const auto& name : report.safe_unused) {
                out_ << "  " << paint(colors::CYAN, name) << "\n";
            }
        }
    }

    void ReportPrinter::print_evidence(const analysis::AnalysisReport& report) const {
        heading("Evidence");

        Table table({
            {"Package", 0, false},
            {"State", 0, false},
            {"Files", 0, true},
            {"Required by", 40, false},
        });
        for (const auto& dep : report.declared) {
            const auto it = report.records.find(dep.name);
            if (it == report.records.end()) {
                continue;
            }
            const auto& record = it->second;
            table.add_row({
                record.name,
                to_string(record.state),
                std::to_string(record.used_in_files.size()),
                joined(record.required_by_packages, 3),
            });
        }
        table.render(out_);
    }

    void ReportPrinter::print_statistics(const analysis::RunStatistics& stats) const {
        heading("Statistics");

        out_ << "Installed packages:   " << format_count(stats.installed_packages) << "\n";
        out_ << "Batch size:           " << stats.batch_size << "\n";
        out_ << "Batches:              " << format_count(stats.batches.batches)
             << " (" << format_count(stats.batches.items) << " items)\n";
        out_ << "Memory pressure:      " << stats.batches.pressure_events << " events\n";

        if (!stats.caches.empty()) {
            out_ << "\n";
            Table caches({
                {"Cache", 0, false},
                {"Hits", 0, true},
                {"Misses", 0, true},
                {"Evictions", 0, true},
                {"Hit rate", 0, true},
            });
            for (const auto& [name, c] : stats.caches) {
                caches.add_row({
                    name,
                    format_count(c.hits),
                    format_count(c.misses),
                    format_count(c.evictions),
                    format_percent(c.hit_rate()),
                });
            }
            caches.render(out_);
        }

        if (!stats.phases.empty()) {
            out_ << "\n";
            Table phases({
                {"Phase", 0, false},
                {"Calls", 0, true},
                {"Total", 0, true},
                {"Max", 0, true},
            });
            for (const auto& [name, timing] : stats.phases) {
                phases.add_row({
                    name,
                    format_count(timing.calls),
                    format_duration(timing.total),
                    format_duration(timing.max),
                });
            }
            phases.render(out_);
        }
    }

    void ReportPrinter::print_diagnostics(const std::vector<Error>& diagnostics) const {
        if (diagnostics.empty()) {
            return;
        }
        heading("Diagnostics");
        for (const auto& error : diagnostics) {
            out_ << "  " << paint(colors::DIM, error.to_string()) << "\n";
        }
    }

}  // namespace dsv::cli

//
// Created by gregorian-rayne on 10/19/26.
//

#ifndef DEPSIEVE_FORMATTER_HPP
#define DEPSIEVE_FORMATTER_HPP

/**
 * @file formatter.hpp
 * @brief Output formatting utilities for the CLI.
 *
 * Provides consistent formatting for:
 * - Tables
 * - Duration values
 * - Colors and styles
 * - The human-readable analysis report
 */

#include "dsv/analysis/report.hpp"
#include "dsv/types.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace dsv::cli {

    /**
     * Terminal color codes.
     */
    namespace colors {

        extern const char* RESET;
        extern const char* BOLD;
        extern const char* DIM;

        extern const char* RED;
        extern const char* GREEN;
        extern const char* YELLOW;
        extern const char* CYAN;

        /**
         * Returns true if colors should be used.
         */
        bool enabled();

        /**
         * Enable/disable colors globally.
         */
        void set_enabled(bool enable);

    }  // namespace colors

    /**
     * Returns true when stdout is a terminal.
     */
    [[nodiscard]] bool is_tty();

    /**
     * Table column definition.
     */
    struct Column {
        std::string header;
        std::size_t width = 0;    // 0 = auto
        bool right_align = false;
    };

    using Row = std::vector<std::string>;

    /**
     * Table formatter for aligned output.
     */
    class Table {
    public:
        explicit Table(std::vector<Column> columns);

        void add_row(Row row);

        [[nodiscard]] bool empty() const noexcept { return rows_.empty(); }

        [[nodiscard]] std::string render() const;

        void render(std::ostream& out) const;

    private:
        [[nodiscard]] std::vector<std::size_t> widths() const;

        std::vector<Column> columns_;
        std::vector<Row> rows_;
    };

    /**
     * Formats a duration for display.
     */
    [[nodiscard]] std::string format_duration(Duration d);

    /**
     * Formats a count with comma separators.
     */
    [[nodiscard]] std::string format_count(std::size_t count);

    [[nodiscard]] std::string format_percent(double ratio);

    /**
     * Summary printer for analysis reports.
     */
    class ReportPrinter {
    public:
        explicit ReportPrinter(std::ostream& out);

        void print_summary(const analysis::AnalysisReport& report) const;

        /**
         * Lists the removable dependencies, or a success line when none.
         */
        void print_unused(const analysis::AnalysisReport& report) const;

        /**
         * Lists unused protected and safe-listed dependencies.
         */
        void print_kept(const analysis::AnalysisReport& report) const;

        /**
         * Per-dependency evidence table.
         */
        void print_evidence(const analysis::AnalysisReport& report) const;

        void print_statistics(const analysis::RunStatistics& stats) const;

        void print_diagnostics(const std::vector<Error>& diagnostics) const;

    private:
        void heading(std::string_view title) const;

        std::ostream& out_;
    };

}  // namespace dsv::cli

#endif //DEPSIEVE_FORMATTER_HPP

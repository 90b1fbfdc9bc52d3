#pragma once
#include "timed_invoker.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

struct ComparisonRow {
    std::string label;
    std::optional<double> left_ms;
    std::optional<double> right_ms;
    std::optional<double> speedup;      // left_ms / right_ms, only when both are positive

    nlohmann::json to_json() const;
};

// Maps raw stage durations (kUnavailableMs for failures) to a row.
ComparisonRow make_row(const std::string& label, double left_ms, double right_ms);

class ComparisonReporter {
public:
    explicit ComparisonReporter(std::ostream& out) : out_(out) {}

    // One row per stage present on either side, left stage order first.
    static std::vector<ComparisonRow> rows(const AdapterResult& left, const AdapterResult& right);

    // Builds the rows and, unless printing is off, renders them as a table titled label.
    std::vector<ComparisonRow> compare(const std::string& label, const AdapterResult& left,
                                       const AdapterResult& right);

    void set_printing(bool on) { printing_ = on; }

    void print_table(const std::string& label, const std::string& left_name, const std::string& right_name,
                     const std::vector<ComparisonRow>& rows);

    static std::string format_ms(const std::optional<double>& ms);
    static std::string format_speedup(const std::optional<double>& speedup);

private:
    std::ostream& out_;
    bool printing_{true};
};

#include "comparison_reporter.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>

using json = nlohmann::json;

json ComparisonRow::to_json() const {
    auto opt = [](const std::optional<double>& v) -> json { return v ? json(*v) : json(nullptr); };
    return {{"label", label}, {"left_ms", opt(left_ms)}, {"right_ms", opt(right_ms)}, {"speedup", opt(speedup)}};
}

ComparisonRow make_row(const std::string& label, double left_ms, double right_ms) {
    ComparisonRow row;
    row.label = label;
    if (left_ms >= 0.0) row.left_ms = left_ms;
    if (right_ms >= 0.0) row.right_ms = right_ms;
    if (left_ms > 0.0 && right_ms > 0.0) row.speedup = left_ms / right_ms;
    return row;
}

std::vector<ComparisonRow> ComparisonReporter::rows(const AdapterResult& left, const AdapterResult& right) {
    std::vector<std::string> labels;
    for (const auto* side : {&left, &right}) {
        for (const auto& s : side->stages) {
            if (std::find(labels.begin(), labels.end(), s.stage) == labels.end()) labels.push_back(s.stage);
        }
    }
    std::vector<ComparisonRow> out;
    for (const auto& label : labels) out.push_back(make_row(label, left.ms(label), right.ms(label)));
    return out;
}

std::vector<ComparisonRow> ComparisonReporter::compare(const std::string& label, const AdapterResult& left,
                                                       const AdapterResult& right) {
    auto out = rows(left, right);
    if (printing_) print_table(label, left.adapter, right.adapter, out);
    return out;
}

std::string ComparisonReporter::format_ms(const std::optional<double>& ms) {
    if (!ms) return "N/A";
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2) << *ms << " ms";
    return ss.str();
}

std::string ComparisonReporter::format_speedup(const std::optional<double>& speedup) {
    if (!speedup) return "N/A";
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(1) << *speedup << "x";
    return ss.str();
}

void ComparisonReporter::print_table(const std::string& label, const std::string& left_name,
                                     const std::string& right_name, const std::vector<ComparisonRow>& rows) {
    const int stage_w = 12;
    const int left_w = std::max<int>(14, static_cast<int>(left_name.size()) + 2);
    const int right_w = std::max<int>(14, static_cast<int>(right_name.size()) + 2);
    const int speed_w = 10;

    out_ << "\n== " << label << " ==\n";
    out_ << std::left << std::setw(stage_w) << "stage"
         << std::right << std::setw(left_w) << left_name
         << std::setw(right_w) << right_name
         << std::setw(speed_w) << "speedup" << "\n";
    out_ << std::string(stage_w + left_w + right_w + speed_w, '-') << "\n";
    for (const auto& r : rows) {
        out_ << std::left << std::setw(stage_w) << r.label
             << std::right << std::setw(left_w) << format_ms(r.left_ms)
             << std::setw(right_w) << format_ms(r.right_ms)
             << std::setw(speed_w) << format_speedup(r.speedup) << "\n";
    }
    out_ << std::left;
}

#pragma once

#include "sqlgate/store.hpp"

#include <algorithm>
#include <ostream>
#include <string>
#include <vector>

namespace sqlgate::internal {

    // Boxed text table, columns sized to their widest cell.
    class table_printer {
      public:
        // Repeated names collapse to their first position, as in `row`.
        void set_columns(const std::vector<std::string>& cols) {
            columns_.clear();
            for (const auto& col : cols) {
                if (std::ranges::find(columns_, col) == columns_.end()) {
                    columns_.push_back(col);
                }
            }
            widths_.assign(columns_.size(), 0U);
            for (size_t i = 0; i < columns_.size(); ++i) {
                widths_[i] = columns_[i].size();
            }
        }

        void add_row(const row& r) {
            std::vector<std::string> cells{};
            cells.reserve(columns_.size());
            for (const auto& col : columns_) {
                const auto* v = r.find(col);
                cells.push_back(v ? display_value(*v) : std::string{"NULL"});
            }
            for (size_t i = 0; i < cells.size(); ++i) {
                widths_[i] = std::max(widths_[i], cells[i].size());
            }
            rows_.push_back(std::move(cells));
        }

        void print(std::ostream& os) const {
            if (columns_.empty()) {
                os << "OK\n";
                return;
            }

            std::string sep{"+"};
            for (auto w : widths_) {
                sep += std::string(w + 2U, '-') + "+";
            }

            os << sep << '\n';
            print_cells(os, columns_);
            os << sep << '\n';
            for (const auto& cells : rows_) {
                print_cells(os, cells);
            }
            os << sep << '\n';
            os << rows_.size() << " row(s)\n";
        }

      private:
        void print_cells(std::ostream& os, const std::vector<std::string>& cells) const {
            os << '|';
            for (size_t i = 0; i < cells.size(); ++i) {
                os << ' ' << cells[i] << std::string(widths_[i] - cells[i].size(), ' ') << " |";
            }
            os << '\n';
        }

        std::vector<std::string> columns_{};
        std::vector<size_t> widths_{};
        std::vector<std::vector<std::string>> rows_{};
    };

}  // namespace sqlgate::internal

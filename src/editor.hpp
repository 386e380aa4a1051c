#pragma once

#include "sqlgate/config.hpp"
#include "sqlgate/utils.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sqlgate::cli {

    class line_editor {
      public:
        line_editor(const startup_config& cfg, std::vector<std::string> table_names);
        ~line_editor() = default;

        line_editor(const line_editor&) = delete;
        line_editor& operator=(const line_editor&) = delete;

        std::optional<std::string> read_line(std::string_view prompt);
        void record_history(std::string_view line);

      private:
        std::vector<std::string> table_names_{};
        bool history_enabled_{true};
    };

}  // namespace sqlgate::cli

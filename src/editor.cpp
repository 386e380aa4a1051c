#include "editor.hpp"

extern "C" {
#include <isocline.h>
}

#include <filesystem>
#include <string_view>
#include <system_error>

namespace sqlgate::cli { namespace detail {

    using namespace std::string_view_literals;

    static const char* command_completions[] = {
            ":help", ":tables", ":schema", ":sample", ":show", ":set", ":quit", ":q", nullptr};

    static const char* show_completions[] = {"config", nullptr};
    static const char* set_completions[] = {"output=table", "output=json", nullptr};

    static const char* sql_completions[] = {
            "SELECT",
            "FROM",
            "WHERE",
            "GROUP BY",
            "ORDER BY",
            "LIMIT",
            "JOIN",
            "LEFT JOIN",
            "COUNT(*)",
            "DISTINCT",
            nullptr};

    static constexpr std::string_view first_token(std::string_view value) {
        auto end = value.find_first_of(" \t\r\n");
        if (end == std::string_view::npos) {
            return value;
        }
        return value.substr(0, end);
    }

    static bool is_command_char(const char* s, long len) {
        if (len == 1 && s[0] == ':') {
            return true;
        }
        return ic_char_is_idletter(s, len);
    }

    static void complete_from(ic_completion_env_t* cenv, const char* prefix, const char** completions) {
        (void)ic_add_completions(cenv, prefix, completions);
    }

    static void complete_commands(ic_completion_env_t* cenv, const char* prefix) {
        complete_from(cenv, prefix, command_completions);
    }

    static void complete_show_args(ic_completion_env_t* cenv, const char* prefix) {
        complete_from(cenv, prefix, show_completions);
    }

    static void complete_set_args(ic_completion_env_t* cenv, const char* prefix) {
        complete_from(cenv, prefix, set_completions);
    }

    static void complete_tables(ic_completion_env_t* cenv, const char* prefix) {
        auto* names = static_cast<const std::vector<std::string>*>(ic_completion_arg(cenv));
        if (names == nullptr) {
            return;
        }
        std::string_view word{prefix};
        for (const auto& name : *names) {
            if (name.starts_with(word)) {
                if (!ic_add_completion(cenv, name.c_str())) {
                    return;
                }
            }
        }
    }

    static void complete_sql(ic_completion_env_t* cenv, const char* prefix) {
        complete_from(cenv, prefix, sql_completions);
        complete_tables(cenv, prefix);
    }

    static void complete_repl(ic_completion_env_t* cenv, const char* prefix) {
        if (prefix == nullptr) {
            return;
        }

        auto trimmed = utils::trim_left(std::string_view{prefix});
        if (trimmed.empty()) {
            ic_complete_word(cenv, prefix, complete_commands, is_command_char);
            return;
        }

        if (!trimmed.starts_with(':')) {
            ic_complete_word(cenv, prefix, complete_sql, nullptr);
            return;
        }

        auto command = first_token(trimmed);
        auto has_args = command.size() < trimmed.size();
        if (!has_args) {
            ic_complete_word(cenv, prefix, complete_commands, is_command_char);
            return;
        }

        if (command == ":show"sv) {
            ic_complete_word(cenv, prefix, complete_show_args, nullptr);
            return;
        }
        if (command == ":set"sv) {
            ic_complete_word(cenv, prefix, complete_set_args, nullptr);
            return;
        }
        if (command == ":schema"sv || command == ":sample"sv) {
            ic_complete_word(cenv, prefix, complete_tables, nullptr);
            return;
        }
    }

}}  // namespace sqlgate::cli::detail

namespace sqlgate::cli {

    namespace fs = std::filesystem;

    line_editor::line_editor(const startup_config& cfg, std::vector<std::string> table_names)
            : table_names_{std::move(table_names)}, history_enabled_{cfg.history_enabled} {
        ic_enable_multiline(true);
        ic_enable_history_duplicates(false);
        ic_set_prompt_marker("", "");
        ic_set_default_completer(detail::complete_repl, &table_names_);

        switch (cfg.color) {
            case color_mode::automatic:
                break;
            case color_mode::always:
                ic_enable_color(true);
                break;
            case color_mode::never:
                ic_enable_color(false);
                break;
        }

        if (!cfg.history_enabled) {
            ic_set_history(nullptr, 1000);
            return;
        }

        std::error_code ec{};
        auto history_parent = cfg.history_file.parent_path();
        if (!history_parent.empty()) {
            fs::create_directories(history_parent, ec);
        }

        auto history_file = cfg.history_file.string();
        ic_set_history(history_file.c_str(), 1000);
    }

    std::optional<std::string> line_editor::read_line(std::string_view prompt) {
        auto prompt_text = std::string(prompt);
        auto* raw = ic_readline(prompt_text.c_str());
        if (raw == nullptr) {
            return std::nullopt;
        }

        std::string line{raw};
        ic_free(raw);
        return line;
    }

    void line_editor::record_history(std::string_view line) {
        if (!history_enabled_) {
            return;
        }
        auto entry = std::string(line);
        ic_history_add(entry.c_str());
    }

}  // namespace sqlgate::cli

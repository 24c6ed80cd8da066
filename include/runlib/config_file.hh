#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <runlib/concat_tostr.hh>
#include <runlib/file_path.hh>
#include <runlib/string_transform.hh>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

// Parser of files consisting of lines `name: value` (`name = value` is also accepted).
// Value is a literal, a 'single-quoted' or "double-quoted" string or an array [a, b, c].
// Everything after an unquoted # is a comment.
class ConfigFile {
public:
    class ParseError : public std::runtime_error {
    public:
        explicit ParseError(const std::string& msg)
        : runtime_error(msg) {}

        template <class... Args, std::enable_if_t<(is_string_argument<Args> and ...), int> = 0>
        ParseError(size_t line, size_t pos, Args&&... msg)
        : runtime_error(concat_tostr("line ", line, ':', pos, ": ", std::forward<Args>(msg)...)
          ) {}

        ParseError(const ParseError& pe) = default;
        ParseError(ParseError&&) noexcept = default;
        ParseError& operator=(const ParseError& pe) = default;
        ParseError& operator=(ParseError&&) noexcept = default;

        ~ParseError() noexcept override = default;
    };

    class Variable {
    public:
        static constexpr uint8_t SET = 1; // set if variable appears in the config
        static constexpr uint8_t ARRAY = 2; // set if variable is an array

    private:
        uint8_t flag_ = 0;
        std::string str_;
        std::vector<std::string> arr_;

        void unset() noexcept {
            flag_ = 0;
            str_.clear();
            arr_.clear();
        }

    public:
        Variable() {} // NOLINT(modernize-use-equals-default): compiler bug

        [[nodiscard]] bool is_set() const noexcept { return flag_ & SET; }

        [[nodiscard]] bool is_array() const noexcept { return flag_ & ARRAY; }

        // Returns value as bool or false on error
        [[nodiscard]] bool as_bool() const noexcept {
            return (str_ == "1" or to_lower(str_) == "on" or to_lower(str_) == "true");
        }

        template <class T, std::enable_if_t<std::is_integral_v<T>, int> = 0>
        [[nodiscard]] std::optional<T> as() const noexcept {
            return str2num<T>(str_);
        }

        // Returns value as string (empty if not a string or variable isn't set)
        [[nodiscard]] const std::string& as_string() const noexcept { return str_; }

        // Returns value as array (empty if not an array or variable isn't set)
        [[nodiscard]] const std::vector<std::string>& as_array() const noexcept {
            return arr_;
        }

        friend class ConfigFile;
    };

private:
    std::map<std::string, Variable, std::less<>> vars_; // (name => value)
    static inline const Variable null_var{};

public:
    ConfigFile() = default;

    // Adds variables @p names to variable set, ignores duplications
    template <class... Args>
    void add_vars(Args&&... names) {
        (vars_.emplace(std::forward<Args>(names), Variable{}), ...);
    }

    // Returns a reference to a variable @p name from variable set or to a null_var
    [[nodiscard]] const Variable& get_var(std::string_view name) const noexcept {
        return (*this)[name];
    }

    const Variable& operator[](std::string_view name) const noexcept {
        auto it = vars_.find(name);
        return (it != vars_.end() ? it->second : null_var);
    }

    [[nodiscard]] const decltype(vars_)& get_vars() const noexcept { return vars_; }

    /**
     * @brief Loads config (variables) form file @p pathname
     * @details Uses load_config_from_string()
     *
     * @param pathname config file
     * @param load_all whether load all variables from @p pathname or load only
     *   these from variable set
     *
     * @errors Throws an exception std::runtime_error if an open(2) error
     *   occurs and all exceptions from load_config_from_string()
     */
    void load_config_from_file(FilePath pathname, bool load_all = false);

    /**
     * @brief Loads config (variables) form string @p config
     *
     * @param config input string
     * @param load_all whether load all variables from @p config or load only
     *   these from variable set
     *
     * @errors Throws an exception (ParseError) if an error occurs
     */
    void load_config_from_string(std::string config, bool load_all = false);

    // Check if string @p str is a valid string literal
    static bool is_string_literal(std::string_view str) noexcept;

    // Returns @p str as single-quoted string, '\'' is replaced with "''"
    static std::string escape_to_single_quoted_string(std::string_view str);

    // Returns @p str as double-quoted string with '"', '\\' and control characters escaped
    static std::string escape_to_double_quoted_string(std::string_view str);

    /**
     * @brief Converts string @p str so that it can be safely placed in config file
     * @details Possible cases:
     *   1) @p str contains '\'' or a control character: @p str is escaped via
     *     escape_to_double_quoted_string().
     *   2) Otherwise if @p str is string literal (is_string_literal(@p str)):
     *     Unchanged @p str is returned.
     *   3) Otherwise: @p str is escaped via escape_to_single_quoted_string().
     *
     *   Examples:
     *     "" -> '' (single quoted string, special case)
     *     "foo-bar" -> foo-bar (string literal)
     *     "line: 1\nab d E\n" -> "line: 1\nab d E\n" (double quoted string)
     *     " My awesome text" -> ' My awesome text' (single quoted string)
     */
    static std::string escape_string(std::string_view str);
};

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace sturdypatch {

// Forward declarations
struct Patch;
struct Screen;
enum class InputEvent;

// Abstract interfaces for dependency injection
class ITerminal {
public:
    virtual ~ITerminal() = default;
    virtual auto setup_raw_mode() -> bool = 0;
    virtual auto get_input_event() -> InputEvent = 0;
    virtual auto display_screen(const Screen& screen) -> void = 0;
    virtual auto read_line() -> std::string = 0;
    virtual auto is_interactive() -> bool = 0;
    virtual auto restore_terminal_state() -> void = 0;
};

class IFileSystem {
public:
    virtual ~IFileSystem() = default;
    virtual auto read_text(const std::string& path) -> std::optional<std::string> = 0;
    virtual auto write_text(const std::string& text, const std::string& path) -> bool = 0;
    virtual auto file_exists(const std::string& path) -> bool = 0;
    virtual auto list_directory(const std::string& path) -> std::vector<std::string> = 0;
    virtual auto create_directories(const std::string& path) -> bool = 0;
};

class IPatchParser {
public:
    virtual ~IPatchParser() = default;
    // Throws ValidationError on a malformed payload
    virtual auto parse_patch(const std::string& payload) -> Patch = 0;
};

} // namespace sturdypatch

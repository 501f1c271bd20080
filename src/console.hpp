#pragma once

#include <mutex>
#include <string>

#include "events.hpp"

namespace meshlobby {

// Thread-safe console output for user interaction.
// NOTE: This is NOT used for internal logs.
class Console {
public:
    void println(const std::string& s);
    void print(const std::string& s);

    // Renders an asynchronous notification on its own line.
    void notify(const Event& ev);

    void set_prompt(const std::string& prompt);

private:
    std::mutex mu_;
    std::string prompt_;
};

} // namespace meshlobby

#include "console.hpp"

#include <iostream>

namespace meshlobby {

void Console::println(const std::string& s) {
    std::lock_guard<std::mutex> lk(mu_);
    std::cout << s << std::endl;
}

void Console::print(const std::string& s) {
    std::lock_guard<std::mutex> lk(mu_);
    std::cout << s;
    std::cout.flush();
}

void Console::set_prompt(const std::string& prompt) {
    std::lock_guard<std::mutex> lk(mu_);
    prompt_ = prompt;
}

void Console::notify(const Event& ev) {
    std::lock_guard<std::mutex> lk(mu_);
    // Start on a fresh line and restore the prompt afterwards.
    std::cout << "\r" << events::describe(ev) << "\n" << prompt_;
    std::cout.flush();
}

} // namespace meshlobby

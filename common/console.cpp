#include "console.hpp"

#include <iostream>
#include <thread>

Console::Console(MainContext& context, Handler handler, std::istream& in)
    : link_(std::make_shared<Link>()), handler_(std::move(handler)), in_(in) {
    link_->context = &context;
}

Console::Console(MainContext& context, Handler handler)
    : Console(context, std::move(handler), std::cin) {}

Console::~Console() {
    std::lock_guard<std::mutex> lock(link_->mutex);
    link_->context = nullptr;
}

void Console::start() {
    std::shared_ptr<Link> link = link_;
    Handler handler = handler_;
    std::istream* in = &in_;
    std::thread([link, handler, in] {
        std::string line;
        while (std::getline(*in, line)) {
            std::string command, arg;
            split(line, command, arg);
            if (command.empty()) continue;
            std::lock_guard<std::mutex> lock(link->mutex);
            if (!link->context) return;
            link->context->post([handler, command, arg] { handler(command, arg); });
            if (command == "quit") return;
        }
        std::lock_guard<std::mutex> lock(link->mutex);
        if (link->context) link->context->stop();
    }).detach();
}

void Console::split(const std::string& line, std::string& command, std::string& arg) {
    const size_t start = line.find_first_not_of(" \t");
    if (start == std::string::npos) {
        command.clear();
        arg.clear();
        return;
    }
    const size_t space = line.find_first_of(" \t", start);
    if (space == std::string::npos) {
        command = line.substr(start);
        arg.clear();
        return;
    }
    command = line.substr(start, space - start);
    const size_t arg_start = line.find_first_not_of(" \t", space);
    arg = arg_start == std::string::npos ? "" : line.substr(arg_start);
    const size_t arg_end = arg.find_last_not_of(" \t\r");
    arg = arg_end == std::string::npos ? "" : arg.substr(0, arg_end + 1);
}

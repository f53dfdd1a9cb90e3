#pragma once
#include <functional>
#include <istream>
#include <memory>
#include <mutex>
#include <string>

#include "main_context.hpp"

/*
 * Console
 * Reads commands from |in| on its own thread and posts each line onto the
 * owning context. End of input stops the context.
 *
 * The reader blocks in getline and cannot be interrupted, so it is detached.
 * It reaches the context only through a link that the destructor cuts: once
 * the Console is gone nothing more is posted. Declare the Console after the
 * MainContext it posts to.
 */
class Console {
public:
    using Handler = std::function<void(const std::string& command, const std::string& arg)>;

    Console(MainContext& context, Handler handler, std::istream& in);
    Console(MainContext& context, Handler handler);
    ~Console();

    void start();

    // Splits "cmd arg..." at the first space.
    static void split(const std::string& line, std::string& command, std::string& arg);

private:
    struct Link {
        std::mutex mutex;
        MainContext* context;
    };

    std::shared_ptr<Link> link_;
    Handler handler_;
    std::istream& in_;
};

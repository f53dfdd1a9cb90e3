#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

#include "console.hpp"
#include "main_context.hpp"

using Commands = std::vector<std::pair<std::string, std::string>>;

TEST(Console, SplitsCommandFromArgument) {
    std::string command, arg;
    Console::split("  rest   45 \r", command, arg);
    EXPECT_EQ(command, "rest");
    EXPECT_EQ(arg, "45");

    Console::split("show", command, arg);
    EXPECT_EQ(command, "show");
    EXPECT_EQ(arg, "");

    Console::split(" \t ", command, arg);
    EXPECT_EQ(command, "");
}

TEST(Console, EndOfInputStopsTheContext) {
    MainContext context;
    std::istringstream in("show\n\n  add 30 \n");
    Commands seen;
    Console console(context, [&](const std::string& c, const std::string& a) { seen.emplace_back(c, a); },
                    in);
    console.start();

    context.run();
    // stop() follows the last post, so anything left is already queued.
    context.run_pending();
    EXPECT_EQ(seen, (Commands{{"show", ""}, {"add", "30"}}));
}

TEST(Console, QuitEndsReading) {
    MainContext context;
    std::istringstream in("quit\nshow\n");
    Commands seen;
    Console console(context,
                    [&](const std::string& c, const std::string& a) {
                        seen.emplace_back(c, a);
                        if (c == "quit") context.stop();
                    },
                    in);
    console.start();

    context.run();
    context.run_pending();
    EXPECT_EQ(seen, (Commands{{"quit", ""}}));
}

#pragma once

#include <iosfwd>
#include <string>

class Node;

struct ConsoleCommand {
    enum class Kind { Send, Check, Url, Help, Quit, Empty, Unknown };

    Kind kind = Kind::Empty;
    std::string argument;   // path for Send, the verb for Unknown
};

/// Parse one line of console input. Pure.
ConsoleCommand parse_command(const std::string& line);

/**
 * Line-oriented front end for the relay: stage a file, check the inbox,
 * show the URL. Reads until "quit" or end of input.
 */
class ConsoleShell {
public:
    ConsoleShell(Node& node, std::istream& in, std::ostream& out);

    void run();

    /// Run one command; false once the shell should exit.
    bool execute(const ConsoleCommand& command);

private:
    void print_help();

    Node& node_;
    std::istream& in_;
    std::ostream& out_;
};

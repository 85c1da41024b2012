/**
 * ConsoleShell - interactive commands for the person at the serving machine.
 */

#include "ui/console_shell.h"

#include "util/string_util.h"
#include "node/node.h"

#include <filesystem>
#include <istream>
#include <ostream>

namespace {

std::string unquote(std::string s) {
    if (s.size() >= 2 && (s.front() == '"' || s.front() == '\'') && s.back() == s.front()) {
        return s.substr(1, s.size() - 2);
    }
    return s;
}

} // namespace

ConsoleCommand parse_command(const std::string& line) {
    ConsoleCommand cmd;
    const auto text = trim(line);
    if (text.empty()) {
        return cmd;
    }

    const auto space = text.find_first_of(" \t");
    const auto verb = to_lower(text.substr(0, space));
    const auto rest = space == std::string::npos ? std::string{} : trim(text.substr(space));

    if (verb == "send" || verb == "stage") {
        cmd.kind = ConsoleCommand::Kind::Send;
        cmd.argument = unquote(rest);
    } else if (verb == "check" || verb == "inbox") {
        cmd.kind = ConsoleCommand::Kind::Check;
    } else if (verb == "url") {
        cmd.kind = ConsoleCommand::Kind::Url;
    } else if (verb == "help" || verb == "?") {
        cmd.kind = ConsoleCommand::Kind::Help;
    } else if (verb == "quit" || verb == "exit") {
        cmd.kind = ConsoleCommand::Kind::Quit;
    } else {
        cmd.kind = ConsoleCommand::Kind::Unknown;
        cmd.argument = verb;
    }
    return cmd;
}

ConsoleShell::ConsoleShell(Node& node, std::istream& in, std::ostream& out)
    : node_(node), in_(in), out_(out) {}

void ConsoleShell::run() {
    out_ << "Open " << node_.session().url << " on your " << node_.config().peer_name
         << " device.\n";
    print_help();

    std::string line;
    for (;;) {
        out_ << "> " << std::flush;
        if (!std::getline(in_, line) || !execute(parse_command(line))) {
            return;
        }
    }
}

bool ConsoleShell::execute(const ConsoleCommand& command) {
    switch (command.kind) {
        case ConsoleCommand::Kind::Send: {
            if (command.argument.empty()) {
                out_ << "usage: send <path>\n";
                break;
            }
            const std::filesystem::path path(command.argument);
            if (node_.stage(path)) {
                out_ << "Ready to send: " << path.filename().string() << '\n';
            } else {
                out_ << "Could not stage " << command.argument << '\n';
            }
            break;
        }
        case ConsoleCommand::Kind::Check:
            out_ << node_.inspect() << '\n';
            break;
        case ConsoleCommand::Kind::Url:
            out_ << node_.session().url << '\n';
            break;
        case ConsoleCommand::Kind::Help:
            print_help();
            break;
        case ConsoleCommand::Kind::Quit:
            return false;
        case ConsoleCommand::Kind::Empty:
            break;
        case ConsoleCommand::Kind::Unknown:
            out_ << "Unknown command: " << command.argument << " (try 'help')\n";
            break;
    }
    return true;
}

void ConsoleShell::print_help() {
    out_ << "Commands:\n"
         << "  send <path>   stage a file for the " << node_.config().peer_name << " to download\n"
         << "  check         show received files\n"
         << "  url           print the server address\n"
         << "  quit          stop the server\n";
}

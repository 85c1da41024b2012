#include <gtest/gtest.h>

#include "node/node.h"
#include "test_util.h"
#include "ui/console_shell.h"

#include <sstream>

TEST(ConsoleCommandTest, ParsesVerbs) {
    EXPECT_EQ(parse_command("").kind, ConsoleCommand::Kind::Empty);
    EXPECT_EQ(parse_command("   ").kind, ConsoleCommand::Kind::Empty);
    EXPECT_EQ(parse_command("check").kind, ConsoleCommand::Kind::Check);
    EXPECT_EQ(parse_command("URL").kind, ConsoleCommand::Kind::Url);
    EXPECT_EQ(parse_command("help").kind, ConsoleCommand::Kind::Help);
    EXPECT_EQ(parse_command("quit").kind, ConsoleCommand::Kind::Quit);
    EXPECT_EQ(parse_command("exit").kind, ConsoleCommand::Kind::Quit);

    const auto unknown = parse_command("frobnicate now");
    EXPECT_EQ(unknown.kind, ConsoleCommand::Kind::Unknown);
    EXPECT_EQ(unknown.argument, "frobnicate");
}

TEST(ConsoleCommandTest, SendTakesWholePath) {
    auto cmd = parse_command("send /home/me/My Documents/report.pdf");
    EXPECT_EQ(cmd.kind, ConsoleCommand::Kind::Send);
    EXPECT_EQ(cmd.argument, "/home/me/My Documents/report.pdf");

    cmd = parse_command("  send   \"/tmp/a b.txt\"  ");
    EXPECT_EQ(cmd.argument, "/tmp/a b.txt");

    EXPECT_TRUE(parse_command("send").argument.empty());
}

TEST(ConsoleShellTest, StagesAndChecks) {
    TempDir tmp;
    asio::io_context io;
    Node node(io, tmp.path(), RelayConfig{});
    write_file(tmp.path() / "photo.jpg", "jpg");

    std::istringstream in("check\nsend " + (tmp.path() / "photo.jpg").string() +
                          "\nsend /does/not/exist\nbogus\nquit\ncheck\n");
    std::ostringstream out;
    ConsoleShell shell(node, in, out);
    shell.run();

    const auto text = out.str();
    EXPECT_NE(text.find("No files received"), std::string::npos);
    EXPECT_NE(text.find("Ready to send: photo.jpg"), std::string::npos);
    EXPECT_NE(text.find("Could not stage /does/not/exist"), std::string::npos);
    EXPECT_NE(text.find("Unknown command: bogus"), std::string::npos);
    EXPECT_EQ(text.find("No files received"), text.rfind("No files received"));
    EXPECT_TRUE(std::filesystem::exists(tmp.path() / "to_android" / "photo.jpg"));
}

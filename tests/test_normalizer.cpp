/*
 * Normalizer tests - WinPath-Guard
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <gtest/gtest.h>
#include <winpath-guard/fix/normalizer.hpp>
#include <string>
#include <vector>

using namespace pathguard;

static std::string fixed(const std::string& cmd) {
    auto r = normalize(cmd);
    return r ? r->command : std::string("<no change>");
}

TEST(NormalizeDrivePaths, UnquotedPath) {
    auto r = normalize(R"cmd(ls -la C:\src\codeflow)cmd");
    ASSERT_TRUE(r);
    EXPECT_EQ(r->command, "ls -la C:/src/codeflow");
    ASSERT_EQ(r->applied.size(), 1u);
    EXPECT_EQ(r->applied[0], FixKind::ForwardSlashes);
}

TEST(NormalizeDrivePaths, SeveralPathsInOneCommand) {
    EXPECT_EQ(fixed(R"cmd(rm C:\src\a\file.json C:\src\b\file.json)cmd"), "rm C:/src/a/file.json C:/src/b/file.json");
}

TEST(NormalizeDrivePaths, QuotedAndTrailingSeparator) {
    EXPECT_EQ(fixed(R"cmd(ls -la "C:\src\project")cmd"), R"cmd(ls -la "C:/src/project")cmd");
    EXPECT_EQ(fixed(R"cmd(ls -la "C:\src\el400\main\.github\workflows\")cmd"), R"cmd(ls -la "C:/src/el400/main/.github/workflows/")cmd");
    EXPECT_EQ(fixed(R"cmd(grep -r "pattern" "C:\src\codjiflo\C\src\styles\" --include="*.css")cmd"),
              R"cmd(grep -r "pattern" "C:/src/codjiflo/C/src/styles/" --include="*.css")cmd");
}

TEST(NormalizeDrivePaths, DoubleAndQuadBackslashes) {
    EXPECT_EQ(fixed(R"cmd(grep pattern C:\\src\\codjiflo\\AGENTS.md)cmd"), "grep pattern C:/src/codjiflo/AGENTS.md");
    EXPECT_EQ(fixed(R"cmd(node -e "require('fs').readFileSync('C:\\\\src\\\\file.json','utf8')")cmd"),
              R"cmd(node -e "require('fs').readFileSync('C:/src/file.json','utf8')")cmd");
    EXPECT_EQ(fixed(R"cmd(node -e "require('fs').readFileSync('C:\\tmp\\kv-ns.json','utf8')")cmd"),
              R"cmd(node -e "require('fs').readFileSync('C:/tmp/kv-ns.json','utf8')")cmd");
}

TEST(NormalizeDrivePaths, AssignmentAndDots) {
    EXPECT_EQ(fixed(R"cmd(VAR=C:\src\project echo test)cmd"), "VAR=C:/src/project echo test");
    EXPECT_EQ(fixed(R"cmd(ls C:\src\el400\main\.github)cmd"), "ls C:/src/el400/main/.github");
}

TEST(NormalizeDrivePaths, PunctuationPrefix) {
    EXPECT_EQ(fixed(R"cmd(curl -d @C:\tmp\body.json http://x)cmd"), "curl -d @C:/tmp/body.json http://x");
    EXPECT_EQ(fixed(R"cmd(ls ~C:\x)cmd"), "ls ~C:/x");
    EXPECT_EQ(fixed(R"cmd(echo #C:\a\b)cmd"), "echo #C:/a/b");
}

TEST(NormalizeDevice, SingleQuotedStdin) {
    auto r = normalize(R"cmd(cat data.json | node -e "JSON.parse(require('fs').readFileSync('/dev/stdin','utf8'))")cmd");
    ASSERT_TRUE(r);
    EXPECT_NE(r->command.find("readFileSync(0,"), std::string::npos);
    EXPECT_EQ(r->command.find("/dev/stdin"), std::string::npos);
    ASSERT_EQ(r->applied.size(), 1u);
    EXPECT_EQ(r->applied[0], FixKind::DeviceAlias);
}

TEST(NormalizeDevice, DoubleQuotedStreams) {
    auto r = normalize(R"cmd(node -e 'require("fs").writeFileSync("/dev/stdout", require("fs").readFileSync("/dev/stdin")); require("fs").writeFileSync("/dev/stderr","x")')cmd");
    ASSERT_TRUE(r);
    EXPECT_EQ(r->command, R"cmd(node -e 'require("fs").writeFileSync(1, require("fs").readFileSync(0)); require("fs").writeFileSync(2,"x")')cmd");
}

TEST(NormalizeDevice, RequiresInlineScriptMarker) {
    EXPECT_FALSE(normalize("curl -s -D /dev/stderr http://localhost:3000/api"));
    EXPECT_FALSE(normalize("cat '/dev/stdin' > out.txt"));
    GuardOptions opts; opts.inline_markers = {"python -c"};
    auto r = normalize(R"cmd(python -c "open('/dev/stdin').read()")cmd", opts);
    ASSERT_TRUE(r);
    EXPECT_EQ(r->command, R"cmd(python -c "open(0).read()")cmd");
}

TEST(NormalizeCombined, BothFixesInOrder) {
    std::string cmd = R"cmd(cat C:\\tmp\\data.json | node -e "JSON.parse(require('fs').readFileSync('/dev/stdin','utf8'))")cmd";
    auto r = normalize(cmd);
    ASSERT_TRUE(r);
    EXPECT_NE(r->command.find("C:/tmp/data.json"), std::string::npos);
    EXPECT_NE(r->command.find("readFileSync(0,"), std::string::npos);
    ASSERT_EQ(r->applied.size(), 2u);
    EXPECT_EQ(r->applied[0], FixKind::DeviceAlias);
    EXPECT_EQ(r->applied[1], FixKind::ForwardSlashes);

    // applying the fixes one at a time in the other order gives the same text
    std::string other = cmd; GuardOptions opts;
    convert_drive_paths(other);
    replace_device_literals(other, opts);
    EXPECT_EQ(other, r->command);
}

TEST(NormalizeCombined, QuadBackslashAndDeviceInOneScript) {
    auto r = normalize(R"cmd(node -e "fs.copyFileSync('C:\\\\in\\\\a.txt', '/dev/stdout')")cmd");
    ASSERT_TRUE(r);
    EXPECT_EQ(r->command, R"cmd(node -e "fs.copyFileSync('C:/in/a.txt', 1)")cmd");
}

TEST(NormalizeNoOp, CleanCommands) {
    for (const char* cmd : {"ls -la C:/src/project", "cd /c/src/project && ls", R"cmd(node -e "console.log('hello')")cmd",
                            "curl https://example.com:8080/api", R"cmd(echo "Error: something failed")cmd",
                            R"cmd(echo "line1\nline2")cmd", ""}) {
        EXPECT_FALSE(normalize(cmd)) << cmd;
    }
}

TEST(NormalizeNote, MentionsFixesAndBypass) {
    auto r = normalize(R"cmd(cat C:\\tmp\\data.json | node -e "JSON.parse(require('fs').readFileSync('/dev/stdin','utf8'))")cmd");
    ASSERT_TRUE(r);
    EXPECT_NE(r->note.find("/dev/stdin"), std::string::npos);
    EXPECT_NE(r->note.find("backslash"), std::string::npos);
    EXPECT_NE(r->note.find("forward slash"), std::string::npos);
    EXPECT_NE(r->note.find("[no-rewrite]"), std::string::npos);
    EXPECT_NE(r->note.find("/dev/stdout"), std::string::npos);
    EXPECT_LT(r->note.find("/dev/stdin"), r->note.find("backslash"));
}

TEST(NormalizeIdempotence, SecondPassIsNoChange) {
    std::vector<std::string> cmds = {
        R"cmd(ls -la C:\src\codeflow)cmd",
        R"cmd(ls -la "C:\src\project\")cmd",
        R"cmd(node -e "require('fs').readFileSync('C:\\\\src\\\\file.json','utf8')")cmd",
        R"cmd(cat C:\\tmp\\data.json | node -e "JSON.parse(require('fs').readFileSync('/dev/stdin','utf8'))")cmd",
        R"cmd(copy C:\a.b:\c D:\x-y:\z)cmd",
        R"cmd(echo C:\\\)cmd",
        R"cmd(x=C:\ y="D:\\")cmd",
        R"cmd(C:\a\b-D:\c)cmd",
        R"cmd(C:\b:\c)cmd",
        R"cmd(curl -d @C:\tmp\body.json -o ~D:\out\x.bin)cmd",
        R"cmd(cp C:\x\@y:\z +E:\w)cmd",
    };
    for (auto &c : cmds) {
        auto first = normalize(c);
        ASSERT_TRUE(first) << c;
        EXPECT_FALSE(normalize(first->command)) << first->command;
    }
}

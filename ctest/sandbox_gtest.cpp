#include <gtest/gtest.h>
#include <string>

#include "lodestone/error.h"
#include "lodestone/sandbox.h"

namespace {

ErrorKind join_error(const std::string& root, const std::string& relative) {
    try {
        scoped_join(root, relative);
    } catch (const ApiError& e) {
        return e.kind();
    }
    return ErrorKind::IOFailure;
}

} // namespace

TEST(ScopedJoin, ResolvesNestedRelativePath) {
    EXPECT_EQ("/srv/inst/a/b/c", scoped_join("/srv/inst", "a/b/c"));
    EXPECT_EQ("/srv/inst/a/b/c", scoped_join("/srv/inst/", "a/b/c"));
}

TEST(ScopedJoin, EmptyPathIsRoot) {
    EXPECT_EQ("/srv/inst", scoped_join("/srv/inst", ""));
    EXPECT_EQ("/srv/inst", scoped_join("/srv/inst", "."));
    EXPECT_EQ("/srv/inst", scoped_join("/srv/inst", "/"));
}

TEST(ScopedJoin, RejectsParentEscape) {
    EXPECT_EQ(ErrorKind::MalformedPath, join_error("/srv/inst", "../../etc/passwd"));
    EXPECT_EQ(ErrorKind::MalformedPath, join_error("/srv/inst", ".."));
    EXPECT_EQ(ErrorKind::MalformedPath, join_error("/srv/inst", "a/../../b"));
}

TEST(ScopedJoin, RejectsBackslashEscape) {
    EXPECT_EQ(ErrorKind::MalformedPath, join_error("/srv/inst", "..\\..\\secret"));
    EXPECT_EQ(ErrorKind::MalformedPath, join_error("/srv/inst", "a\\..\\..\\secret"));
}

TEST(ScopedJoin, NormalizesSeparatorsAndDots) {
    EXPECT_EQ("/srv/inst/world/region", scoped_join("/srv/inst", "world\\region"));
    EXPECT_EQ("/srv/inst/b", scoped_join("/srv/inst", "a/../b"));
    EXPECT_EQ("/srv/inst/a/b", scoped_join("/srv/inst", "./a//./b/"));
}

TEST(ScopedJoin, AbsoluteInputStaysInsideRoot) {
    EXPECT_EQ("/srv/inst/etc/passwd", scoped_join("/srv/inst", "/etc/passwd"));
    EXPECT_EQ("/srv/inst/Windows/system.ini", scoped_join("/srv/inst", "C:\\Windows\\system.ini"));
}

TEST(ScopedJoin, RejectsNulByte) {
    std::string relative("ok.txt");
    relative.push_back('\0');
    relative += "../../x";
    EXPECT_EQ(ErrorKind::MalformedPath, join_error("/srv/inst", relative));
}

TEST(ProtectedFiles, ExecutableAndMarkerExtensionsAreProtected) {
    EXPECT_TRUE(is_file_protected("server.jar"));
    EXPECT_TRUE(is_file_protected("/srv/inst/start.sh"));
    EXPECT_TRUE(is_file_protected("/srv/inst/.lodestone_config"));
    EXPECT_TRUE(is_file_protected("mods/loader.JAR"));
    EXPECT_TRUE(is_file_protected("run.bat"));
    EXPECT_TRUE(is_file_protected("setup.msi"));
    EXPECT_TRUE(is_file_protected("plugins\\script.lua"));
}

TEST(ProtectedFiles, FilesWithoutExtensionAreProtected) {
    EXPECT_TRUE(is_file_protected("eula"));
    EXPECT_TRUE(is_file_protected("/srv/inst/world"));
    EXPECT_TRUE(is_file_protected("notes."));
}

TEST(ProtectedFiles, OrdinaryTextFilesAreWritable) {
    EXPECT_FALSE(is_file_protected("server.properties"));
    EXPECT_FALSE(is_file_protected("/srv/inst/ops.json"));
    EXPECT_FALSE(is_file_protected("logs/latest.log"));
    EXPECT_FALSE(is_file_protected("archive.sh.txt"));
}

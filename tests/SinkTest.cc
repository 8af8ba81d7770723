#include <gtest/gtest.h>
#include <sys/stat.h>
#include <unistd.h>

#include <phosg/Filesystem.hh>
#include <string>

#include "ArchiveBuilder.hh"
#include "sevenzip/Sink.hh"

using namespace std;

class SinkTest : public ::testing::Test {
protected:
  void SetUp() override {
    this->dir = make_temp_dir();
  }
  void TearDown() override {
    remove_tree(this->dir);
  }

  static bool is_dir(const string& path) {
    struct stat st;
    return !lstat(path.c_str(), &st) && S_ISDIR(st.st_mode);
  }

  string dir;
};

TEST_F(SinkTest, StringSink) {
  StringSink s;
  s.write("abc", 3);
  s.write("", 0);
  s.write("de", 2);
  EXPECT_FALSE(s.closed());
  s.close();
  EXPECT_TRUE(s.closed());
  EXPECT_EQ(s.data(), "abcde");
}

TEST_F(SinkTest, FileSinkCreatesParentDirectories) {
  string path = this->dir + "/a/b/c.txt";
  FileSink s(path);
  s.write("hello ", 6);
  s.write("world", 5);
  s.close();
  EXPECT_TRUE(is_dir(this->dir + "/a/b"));
  EXPECT_EQ(phosg::load_file(path), "hello world");
}

TEST_F(SinkTest, FileSinkCreatesEmptyFile) {
  string path = this->dir + "/empty";
  FileSink s(path);
  s.close();
  EXPECT_EQ(phosg::load_file(path), "");
}

TEST_F(SinkTest, DirectorySink) {
  string path = this->dir + "/x/y/z";
  DirectorySink s(path);
  s.write("ignored", 7);
  EXPECT_FALSE(is_dir(path));
  s.close();
  EXPECT_TRUE(is_dir(path));

  // Closing again (directory already exists) is fine
  DirectorySink s2(path);
  s2.close();
}

TEST_F(SinkTest, SymlinkSink) {
  string path = this->dir + "/links/l";
  SymlinkSink s(path);
  s.write("../tar", 6);
  s.write("get", 3);
  s.close();

  char buf[0x100];
  ssize_t len = readlink(path.c_str(), buf, sizeof(buf));
  ASSERT_GT(len, 0);
  EXPECT_EQ(string(buf, len), "../target");
}

TEST_F(SinkTest, MkdirsFailsOnFile) {
  string path = this->dir + "/file";
  phosg::save_file(path, "x");
  EXPECT_THROW(mkdirs(path + "/sub"), runtime_error);
  EXPECT_THROW(mkdirs(path), runtime_error);
}

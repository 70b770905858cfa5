#include "netloom/mime-mappings.hpp"

#include <gtest/gtest.h>

#include <cstddef>
#include <iterator>

namespace netloom {

TEST(MIMEMappings, KnownExtensions) {
  EXPECT_EQ(DetermineMIMETypeStr("index.html"), "text/html");
  EXPECT_EQ(DetermineMIMETypeStr("/assets/app.css"), "text/css");
  EXPECT_EQ(DetermineMIMETypeStr("script.js"), "text/javascript");
  EXPECT_EQ(DetermineMIMETypeStr("data.json"), "application/json");
  EXPECT_EQ(DetermineMIMETypeStr("logo.png"), "image/png");
  EXPECT_EQ(DetermineMIMETypeStr("notes.txt"), "text/plain");
}

TEST(MIMEMappings, UnknownOrMissingExtension) {
  EXPECT_EQ(DetermineMIMETypeStr("file.unknownext"), "");
  EXPECT_EQ(DetermineMIMETypeStr("file.zzz"), "");
  EXPECT_EQ(DetermineMIMETypeStr("Makefile"), "");
  EXPECT_EQ(DetermineMIMETypeStr("file."), "");
  EXPECT_EQ(DetermineMIMETypeStr("dir.d/README"), "");
}

TEST(MIMEMappings, CaseInsensitiveExtensions) {
  EXPECT_EQ(DetermineMIMETypeStr("UPPER.HTML"), "text/html");
  EXPECT_EQ(DetermineMIMETypeStr("Photo.JpG"), "image/jpeg");
}

TEST(MIMEMappings, MultiDotFilenames) { EXPECT_EQ(DetermineMIMETypeStr("archive.tar.gz"), "application/gzip"); }

TEST(MIMEMappings, SortedAndUnique) {
  for (std::size_t pos = 1; pos < std::size(kMIMEMappings); ++pos) {
    EXPECT_LT(kMIMEMappings[pos - 1].extension, kMIMEMappings[pos].extension) << "at index " << pos;
  }
}

}  // namespace netloom

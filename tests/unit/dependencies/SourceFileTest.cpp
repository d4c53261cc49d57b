#include <gtest/gtest.h>

#include <string>

#include "language.hpp"
#include "scoped_directory.hpp"
#include "source_file.hpp"

namespace ccc::deps
{
namespace
{
    using ccc::testing::makeTemporaryRoot;
    using ccc::testing::ScopedDirectory;
    using ccc::testing::writeFile;

    TEST(SourceFileTest, ReadsTextContentOnce)
    {
        ScopedDirectory root{makeTemporaryRoot("ccc-source-text-")};
        const auto path = writeFile(root.path / "main.py", "import os\n");

        SourceFile source{path, Language::Python};
        EXPECT_EQ(source.path(), path);
        EXPECT_EQ(source.language(), Language::Python);

        const SourceReadResult& first = source.read();
        ASSERT_EQ(first.status, SourceReadStatus::Ok);
        EXPECT_EQ(first.content, "import os\n");

        writeFile(path, "import sys\n");
        EXPECT_EQ(&source.read(), &first);
        EXPECT_EQ(source.read().content, "import os\n");
    }

    TEST(SourceFileTest, BinaryAndMalformedContentIsNotText)
    {
        ScopedDirectory root{makeTemporaryRoot("ccc-source-binary-")};
        const auto binary = writeFile(root.path / "blob.py", std::string{"import os\n\0\x01", 12});
        const auto surrogate = writeFile(root.path / "surrogate.js", "import x from './\xED\xA0\x80';\n");

        const SourceReadResult binaryResult = readSourceFile(binary);
        EXPECT_EQ(binaryResult.status, SourceReadStatus::NotText);
        EXPECT_TRUE(binaryResult.content.empty());
        EXPECT_NE(binaryResult.errorMessage.find("blob.py"), std::string::npos);

        EXPECT_EQ(readSourceFile(surrogate).status, SourceReadStatus::NotText);
    }

    TEST(SourceFileTest, MissingFileIsReadFailure)
    {
        ScopedDirectory root{makeTemporaryRoot("ccc-source-missing-")};

        const SourceReadResult result = readSourceFile(root.path / "absent.py");
        EXPECT_EQ(result.status, SourceReadStatus::ReadFailed);
        EXPECT_NE(result.errorMessage.find("absent.py"), std::string::npos);
    }
}
} // namespace ccc::deps

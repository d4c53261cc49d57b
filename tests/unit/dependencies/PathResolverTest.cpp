#include <gtest/gtest.h>

#include <filesystem>
#include <system_error>

#include "language.hpp"
#include "path_resolver.hpp"
#include "scoped_directory.hpp"

namespace ccc::deps
{
namespace
{
    using ccc::testing::makeTemporaryRoot;
    using ccc::testing::ScopedDirectory;
    using ccc::testing::writeFile;

    class PathResolverTest : public ::testing::Test
    {
    protected:
        LanguageRegistry registry{makeDefaultLanguageRegistry()};
        PathResolver resolver{registry};
    };

    TEST_F(PathResolverTest, RelativeImportWithExtension)
    {
        ScopedDirectory root{makeTemporaryRoot("ccc-resolver-relative-")};
        const auto target = writeFile(root.path / "module.js", "// module");
        const auto current = writeFile(root.path / "main.js", "");

        auto resolved = resolver.resolve("./module.js", current, {}, Language::JavaScript);
        ASSERT_TRUE(resolved.has_value());
        EXPECT_EQ(*resolved, target);
    }

    TEST_F(PathResolverTest, RelativeImportTriesExtensions)
    {
        ScopedDirectory root{makeTemporaryRoot("ccc-resolver-extensions-")};
        const auto target = writeFile(root.path / "module.ts", "export {}");
        const auto current = writeFile(root.path / "main.ts", "");

        auto resolved = resolver.resolve("./module", current, {}, Language::TypeScript);
        ASSERT_TRUE(resolved.has_value());
        EXPECT_EQ(*resolved, target);
    }

    TEST_F(PathResolverTest, ParentDirectoryImport)
    {
        ScopedDirectory root{makeTemporaryRoot("ccc-resolver-parent-")};
        const auto target = writeFile(root.path / "module.js", "");
        const auto current = writeFile(root.path / "subdir" / "main.js", "");

        auto resolved = resolver.resolve("../module", current, {root.path}, Language::JavaScript);
        ASSERT_TRUE(resolved.has_value());
        EXPECT_EQ(*resolved, target);
    }

    TEST_F(PathResolverTest, RelativeImportIgnoresRoots)
    {
        ScopedDirectory project{makeTemporaryRoot("ccc-resolver-ignore-roots-")};
        writeFile(project.path / "other" / "helper.js", "");
        const auto local = writeFile(project.path / "src" / "helper.js", "");
        const auto current = writeFile(project.path / "src" / "main.js", "");

        auto resolved = resolver.resolve("./helper", current, {project.path / "other"}, Language::JavaScript);
        ASSERT_TRUE(resolved.has_value());
        EXPECT_EQ(*resolved, local);
    }

    TEST_F(PathResolverTest, DottedPackageUnderRoot)
    {
        ScopedDirectory root{makeTemporaryRoot("ccc-resolver-dotted-")};
        const auto target = writeFile(root.path / "mypackage" / "module.py", "");
        const auto current = writeFile(root.path / "main.py", "");

        auto resolved = resolver.resolve("mypackage.module", current, {root.path}, Language::Python);
        ASSERT_TRUE(resolved.has_value());
        EXPECT_EQ(*resolved, target);
    }

    TEST_F(PathResolverTest, PythonPackageResolvesToInitFile)
    {
        ScopedDirectory root{makeTemporaryRoot("ccc-resolver-package-")};
        const auto target = writeFile(root.path / "pkg" / "__init__.py", "");
        const auto current = writeFile(root.path / "main.py", "");

        auto resolved = resolver.resolve("pkg", current, {root.path}, Language::Python);
        ASSERT_TRUE(resolved.has_value());
        EXPECT_EQ(*resolved, target);
    }

    TEST_F(PathResolverTest, DirectoryWithoutIndexIsUnresolved)
    {
        ScopedDirectory root{makeTemporaryRoot("ccc-resolver-bare-dir-")};
        writeFile(root.path / "namespace_only" / "README.md", "");
        const auto current = writeFile(root.path / "main.py", "");

        EXPECT_FALSE(resolver.resolve("namespace_only", current, {root.path}, Language::Python).has_value());
        EXPECT_FALSE(resolver.resolve("./namespace_only", current, {root.path}, Language::JavaScript).has_value());
    }

    TEST_F(PathResolverTest, ScriptDirectoryResolvesToIndexFile)
    {
        ScopedDirectory root{makeTemporaryRoot("ccc-resolver-index-")};
        const auto target = writeFile(root.path / "components" / "index.js", "");
        const auto current = writeFile(root.path / "app.js", "");

        auto resolved = resolver.resolve("./components", current, {}, Language::JavaScript);
        ASSERT_TRUE(resolved.has_value());
        EXPECT_EQ(*resolved, target);
    }

    TEST_F(PathResolverTest, ExactNameIsTriedBeforeExtensions)
    {
        ScopedDirectory root{makeTemporaryRoot("ccc-resolver-exact-")};
        const auto exact = writeFile(root.path / "config", "");
        writeFile(root.path / "config.js", "");
        const auto current = writeFile(root.path / "main.js", "");

        auto resolved = resolver.resolve("./config", current, {}, Language::JavaScript);
        ASSERT_TRUE(resolved.has_value());
        EXPECT_EQ(*resolved, exact);
    }

    TEST_F(PathResolverTest, ExtensionsAreTriedInTableOrder)
    {
        ScopedDirectory root{makeTemporaryRoot("ccc-resolver-order-")};
        writeFile(root.path / "shapes.pyi", "");
        const auto preferred = writeFile(root.path / "shapes.py", "");
        const auto current = writeFile(root.path / "main.py", "");

        auto resolved = resolver.resolve("shapes", current, {root.path}, Language::Python);
        ASSERT_TRUE(resolved.has_value());
        EXPECT_EQ(*resolved, preferred);
    }

    TEST_F(PathResolverTest, NonexistentImportIsUnresolved)
    {
        ScopedDirectory root{makeTemporaryRoot("ccc-resolver-missing-")};
        const auto current = writeFile(root.path / "main.py", "");

        EXPECT_FALSE(resolver.resolve("nonexistent", current, {root.path}, Language::Python).has_value());
        EXPECT_FALSE(resolver.resolve("", current, {root.path}, Language::Python).has_value());
        EXPECT_FALSE(resolver.resolve("anything", current, {root.path}, Language::Unknown).has_value());
    }

    TEST_F(PathResolverTest, FirstRootWins)
    {
        ScopedDirectory first{makeTemporaryRoot("ccc-resolver-first-")};
        ScopedDirectory second{makeTemporaryRoot("ccc-resolver-second-")};
        const auto preferred = writeFile(first.path / "config.py", "VERSION = 1");
        writeFile(second.path / "config.py", "VERSION = 2");
        const auto current = writeFile(second.path / "main.py", "");

        for (int run = 0; run < 3; ++run)
        {
            auto resolved = resolver.resolve("config", current, {first.path, second.path}, Language::Python);
            ASSERT_TRUE(resolved.has_value());
            EXPECT_EQ(*resolved, preferred);
        }
    }

    TEST_F(PathResolverTest, FallsBackToLaterRoot)
    {
        ScopedDirectory first{makeTemporaryRoot("ccc-resolver-root1-")};
        ScopedDirectory second{makeTemporaryRoot("ccc-resolver-root2-")};
        const auto target = writeFile(second.path / "com" / "example" / "Util.java", "package com.example;");
        const auto current = writeFile(first.path / "com" / "example" / "Main.java", "");

        auto resolved = resolver.resolve("com.example.Util", current, {first.path, second.path}, Language::Java);
        ASSERT_TRUE(resolved.has_value());
        EXPECT_EQ(*resolved, target);
    }

    TEST_F(PathResolverTest, EmptyRootsUseReferencingDirectory)
    {
        ScopedDirectory root{makeTemporaryRoot("ccc-resolver-no-roots-")};
        const auto target = writeFile(root.path / "subdir" / "dep.py", "");
        const auto current = writeFile(root.path / "subdir" / "main.py", "");

        auto resolved = resolver.resolve("dep", current, {}, Language::Python);
        ASSERT_TRUE(resolved.has_value());
        EXPECT_EQ(*resolved, target);
    }

    TEST_F(PathResolverTest, PythonLeadingDotsClimbPackages)
    {
        ScopedDirectory root{makeTemporaryRoot("ccc-resolver-dots-")};
        const auto sibling = writeFile(root.path / "pkg" / "sub" / "sibling.py", "");
        const auto parentModule = writeFile(root.path / "pkg" / "shared" / "util.py", "");
        const auto packageInit = writeFile(root.path / "pkg" / "sub" / "__init__.py", "");
        const auto current = writeFile(root.path / "pkg" / "sub" / "main.py", "");

        auto single = resolver.resolve(".sibling", current, {root.path}, Language::Python);
        ASSERT_TRUE(single.has_value());
        EXPECT_EQ(*single, sibling);

        auto twice = resolver.resolve("..shared.util", current, {root.path}, Language::Python);
        ASSERT_TRUE(twice.has_value());
        EXPECT_EQ(*twice, parentModule);

        auto package = resolver.resolve(".", current, {root.path}, Language::Python);
        ASSERT_TRUE(package.has_value());
        EXPECT_EQ(*package, packageInit);
    }

    TEST_F(PathResolverTest, AbsoluteImportIsLookedUpDirectly)
    {
        ScopedDirectory root{makeTemporaryRoot("ccc-resolver-absolute-")};
        const auto target = writeFile(root.path / "lib" / "module.js", "");
        const auto current = writeFile(root.path / "main.js", "");

        auto resolved = resolver.resolve((root.path / "lib" / "module").string(), current, {}, Language::JavaScript);
        ASSERT_TRUE(resolved.has_value());
        EXPECT_EQ(*resolved, target);
    }

    TEST_F(PathResolverTest, SymlinkedRootsYieldCanonicalPaths)
    {
        ScopedDirectory root{makeTemporaryRoot("ccc-resolver-symlink-")};
        const auto target = writeFile(root.path / "real" / "helpers.py", "");
        const auto current = writeFile(root.path / "main.py", "");

        std::error_code linkError;
        std::filesystem::create_directory_symlink(root.path / "real", root.path / "alias", linkError);
        if (linkError)
        {
            GTEST_SKIP() << "symlinks unavailable: " << linkError.message();
        }

        auto viaLink = resolver.resolve("helpers", current, {root.path / "alias"}, Language::Python);
        auto viaDots = resolver.resolve("./real/../real/helpers.py", current, {}, Language::JavaScript);
        ASSERT_TRUE(viaLink.has_value());
        ASSERT_TRUE(viaDots.has_value());
        EXPECT_EQ(*viaLink, target);
        EXPECT_EQ(*viaDots, target);
    }

    TEST_F(PathResolverTest, ClassifiesImportShapes)
    {
        const LanguageRules* python = registry.find(Language::Python);
        const LanguageRules* script = registry.find(Language::JavaScript);
        ASSERT_NE(python, nullptr);
        ASSERT_NE(script, nullptr);

        EXPECT_EQ(classifyImport("./utils", *script), ImportMode::Relative);
        EXPECT_EQ(classifyImport("../utils", *script), ImportMode::Relative);
        EXPECT_EQ(classifyImport(".hidden", *script), ImportMode::RootRelative);
        EXPECT_EQ(classifyImport(".sibling", *python), ImportMode::Relative);
        EXPECT_EQ(classifyImport("/abs/path", *script), ImportMode::Absolute);
        EXPECT_EQ(classifyImport("lodash/fp", *script), ImportMode::RootRelative);
        EXPECT_EQ(classifyImport("com.example.Util", *python), ImportMode::RootRelative);
    }
}
} // namespace ccc::deps

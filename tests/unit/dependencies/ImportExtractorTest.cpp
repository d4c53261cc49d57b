#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "import_extractor.hpp"
#include "language.hpp"

namespace ccc::deps
{
namespace
{
    using Imports = std::vector<std::string>;

    TEST(ImportExtractorTest, PythonSimpleImports)
    {
        const std::string code = R"(
import os
import sys
import json
)";
        EXPECT_EQ(extractPythonImports(code), (Imports{"os", "sys", "json"}));
    }

    TEST(ImportExtractorTest, PythonFromImportsYieldModule)
    {
        const std::string code = R"(
from typing import List, Dict
from os.path import join, exists
from mypackage.module import MyClass
)";
        EXPECT_EQ(extractPythonImports(code), (Imports{"typing", "os.path", "mypackage.module"}));
    }

    TEST(ImportExtractorTest, PythonCommaSeparatedImportsAndAliases)
    {
        const std::string code = R"(
import os, sys as system, json
import numpy as np
)";
        EXPECT_EQ(extractPythonImports(code), (Imports{"os", "sys", "json", "numpy"}));
    }

    TEST(ImportExtractorTest, PythonRelativeImportsKeepLeadingDots)
    {
        const std::string code = R"(
from .sibling import helper
from ..parent.module import thing
from . import package_member
)";
        EXPECT_EQ(extractPythonImports(code), (Imports{".sibling", "..parent.module", "."}));
    }

    TEST(ImportExtractorTest, PythonWildcardResolvesBaseModuleOnly)
    {
        const std::string code = R"(
from shapes import *
import *
)";
        EXPECT_EQ(extractPythonImports(code), (Imports{"shapes"}));
    }

    TEST(ImportExtractorTest, PythonIgnoresIndentedImports)
    {
        const std::string code = R"(
import top_level

try:
    import optional_dependency
except ImportError:
    optional_dependency = None

def lazy():
    from inside import thing
)";
        EXPECT_EQ(extractPythonImports(code), (Imports{"top_level"}));
    }

    TEST(ImportExtractorTest, PythonTrailingCommentsAreIgnored)
    {
        const std::string code = R"(
import os  # Operating system interface
import sys  // Another comment style
from typing import List  /* Block comment */
)";
        EXPECT_EQ(extractPythonImports(code), (Imports{"os", "sys", "typing"}));
    }

    TEST(ImportExtractorTest, PythonKeepsTextualOrderAndDropsRepeats)
    {
        const std::string code = R"(
from zeta import z
import alpha
from zeta import other
import middle
)";
        EXPECT_EQ(extractPythonImports(code), (Imports{"zeta", "alpha", "middle"}));
    }

    TEST(ImportExtractorTest, ScriptImportForms)
    {
        const std::string code = R"(
import { Component } from 'react';
import './styles.css';
import utils from '../utils';
const fs = require('fs');
const path = require("path");
import * as ns from "./namespace";
)";
        EXPECT_EQ(extractScriptImports(code),
            (Imports{"react", "./styles.css", "../utils", "fs", "path", "./namespace"}));
    }

    TEST(ImportExtractorTest, ScriptTypeImportsAndReExports)
    {
        const std::string code = R"(
import type { UserType } from './types';
export * from './all';
export { api } from '../api';
)";
        EXPECT_EQ(extractScriptImports(code), (Imports{"./types", "./all", "../api"}));
    }

    TEST(ImportExtractorTest, ScriptMultiLineBraceImport)
    {
        const std::string code = R"(import {
  first,
  second,
} from './multi';
import later from './later';
)";
        EXPECT_EQ(extractScriptImports(code), (Imports{"./multi", "./later"}));
    }

    TEST(ImportExtractorTest, ScriptDynamicImportsAreNotRecognised)
    {
        const std::string code = R"(
const lazy = await import('./lazy');
const name = './computed';
const computed = require(name);
import('./also-dynamic');
)";
        EXPECT_TRUE(extractScriptImports(code).empty());
    }

    TEST(ImportExtractorTest, JavaImportForms)
    {
        const std::string code = R"(
package com.example;

import java.util.List;
import java.util.ArrayList;
import static java.lang.Math.PI;
import com.example.MyClass;
import com.example.shapes.*;
import static com.example.Constants.*;
)";
        EXPECT_EQ(extractJavaImports(code),
            (Imports{"java.util.List", "java.util.ArrayList", "java.lang.Math", "com.example.MyClass",
                "com.example.shapes", "com.example.Constants"}));
    }

    TEST(ImportExtractorTest, RulesDispatchByLanguage)
    {
        const LanguageRegistry registry = makeDefaultLanguageRegistry();
        const std::string code = "import os\n";

        EXPECT_EQ(extractImports(code, registry.find(Language::Python)), (Imports{"os"}));
        EXPECT_TRUE(extractImports(code, registry.find(Language::Json)).empty());
        EXPECT_TRUE(extractImports(code, registry.find(Language::Unknown)).empty());
        EXPECT_TRUE(extractImports(code, nullptr).empty());
    }

    TEST(ImportExtractorTest, HugeBraceListsAreScannedWithoutRecursion)
    {
        std::string barrel = "export {";
        while (barrel.size() < 120000)
        {
            barrel += " IconName,";
        }
        barrel += " z } from './icons';\n";

        std::string named = "import {";
        while (named.size() < 120000)
        {
            named += "\n  Widget,";
        }
        named += "\n} from './big';\nconst x = require('./after');\n";

        EXPECT_EQ(extractScriptImports(barrel), (Imports{"./icons"}));
        EXPECT_EQ(extractScriptImports(named), (Imports{"./big", "./after"}));
    }

    TEST(ImportExtractorTest, VeryLongLinesAreScannedWithoutRecursion)
    {
        std::string python = "import\tthings";
        std::string java = "import com.example.Big;\nimport ";
        for (int word = 0; word < 20000; ++word)
        {
            python += " word";
            java += "word";
        }
        python += "\nimport os\n";
        java += ";\n";

        EXPECT_EQ(extractPythonImports(python), (Imports{"os"}));
        ASSERT_FALSE(extractJavaImports(java).empty());
        EXPECT_EQ(extractJavaImports(java).front(), "com.example.Big");
    }

    TEST(ImportExtractorTest, UnterminatedStatementsYieldNothing)
    {
        EXPECT_TRUE(extractScriptImports("import { a, b\nconst c = 1;\n").empty());
        EXPECT_TRUE(extractScriptImports("export { a } to './nowhere';\nimport x from './open\n").empty());
        EXPECT_TRUE(extractScriptImports("const r = require('./unclosed';\n").empty());
        EXPECT_TRUE(extractPythonImports("from\nimport").empty());
    }

    TEST(ImportExtractorTest, TextContentDetection)
    {
        EXPECT_TRUE(isTextContent(""));
        EXPECT_TRUE(isTextContent("plain ascii"));
        EXPECT_TRUE(isTextContent("caf\xC3\xA9 \xE2\x94\x82 \xF0\x9F\x98\x80"));
        EXPECT_TRUE(isTextContent("\xED\x9F\xBF \xF4\x8F\xBF\xBF"));
        EXPECT_FALSE(isTextContent(std::string{"a\0b", 3}));
        EXPECT_FALSE(isTextContent("\xC3"));
        EXPECT_FALSE(isTextContent("\xFF\xFE"));
    }

    TEST(ImportExtractorTest, OverlongAndSurrogateSequencesAreNotText)
    {
        EXPECT_FALSE(isTextContent("\xE0\x80\xAF"));
        EXPECT_FALSE(isTextContent("\xE0\x9F\xBF"));
        EXPECT_FALSE(isTextContent("\xED\xA0\x80"));
        EXPECT_FALSE(isTextContent("\xED\xBF\xBF"));
        EXPECT_FALSE(isTextContent("\xF0\x8F\xBF\xBF"));
        EXPECT_FALSE(isTextContent("\xF4\x90\x80\x80"));
        EXPECT_FALSE(isTextContent("\xC0\xAF"));
    }
}
} // namespace ccc::deps

#include "rules/generated_code.hpp"

#include <gtest/gtest.h>

using namespace aliasorder::rules;

TEST(GeneratedCodeTest, GeneratedFileNames) {
    EXPECT_TRUE(is_generated_file_name("Form1.Designer.cs"));
    EXPECT_TRUE(is_generated_file_name("obj/Debug/App.g.cs"));
    EXPECT_TRUE(is_generated_file_name("obj\\Debug\\App.g.i.cs"));
    EXPECT_TRUE(is_generated_file_name("Model.generated.cs"));
    EXPECT_TRUE(is_generated_file_name("net8.0/App.AssemblyAttributes.cs"));
    EXPECT_TRUE(is_generated_file_name("TemporaryGeneratedFile_036C0B5B.cs"));
}

TEST(GeneratedCodeTest, OrdinaryFileNames) {
    EXPECT_FALSE(is_generated_file_name("Program.cs"));
    EXPECT_FALSE(is_generated_file_name("Designer.cs"));
    EXPECT_FALSE(is_generated_file_name("generated/Program.cs"));
    EXPECT_FALSE(is_generated_file_name("src/TemporaryGeneratedFile_/Program.cs"));
    EXPECT_FALSE(is_generated_file_name(""));
}

TEST(GeneratedCodeTest, AutoGeneratedHeader) {
    EXPECT_TRUE(has_generated_header("// <auto-generated>\n"
                                     "//     This code was generated by a tool.\n"
                                     "// </auto-generated>\n"
                                     "using System;\n"));
    EXPECT_TRUE(has_generated_header("/* <autogenerated /> */ namespace N { }"));
    EXPECT_TRUE(has_generated_header("\xEF\xBB\xBF\n\n// <auto-generated/>\n"));
}

TEST(GeneratedCodeTest, HeaderAfterOtherComments) {
    EXPECT_TRUE(has_generated_header("// Copyright (c) Contoso.\n"
                                     "#pragma warning disable 1591\n"
                                     "/* build */\n"
                                     "// <auto-generated />\n"
                                     "using System;\n"));
}

TEST(GeneratedCodeTest, MarkerAfterFirstTokenIsIgnored) {
    EXPECT_FALSE(has_generated_header("using System;\n// <auto-generated>\n"));
    EXPECT_FALSE(has_generated_header("// Hand written.\nnamespace N { }\n"));
    EXPECT_FALSE(has_generated_header(""));
}

TEST(GeneratedCodeTest, MarkerInPreprocessorLineIsIgnored) {
    EXPECT_FALSE(has_generated_header("#region <auto-generated>\nusing System;\n"));
}

TEST(GeneratedCodeTest, Combined) {
    EXPECT_TRUE(is_generated_code("Form1.Designer.cs", "using System;"));
    EXPECT_TRUE(is_generated_code("Program.cs", "// <auto-generated/>\nusing System;"));
    EXPECT_FALSE(is_generated_code("Program.cs", "using System;"));
}

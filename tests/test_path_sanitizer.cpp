// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include <gtest/gtest.h>
#include "../FtpBridge/Source/base/path_sanitizer.h"

using namespace fbr;


class PathSanitizerTest : public ::testing::Test
{
protected:
    ValidationIssue getIssue(std::string_view path) const
    {
        try
        {
            sanitizePath(path, allowedExtensions_);
        }
        catch (const ValidationError& e) { return e.getIssue(); }

        ADD_FAILURE() << "ValidationError expected for: " << path;
        return ValidationIssue::invalidParameter;
    }

    const std::vector<std::string> allowedExtensions_{".txt", ".csv", ".xlsx"};
};


TEST_F(PathSanitizerTest, AcceptsRegularPath)
{
    const SanitizedPath sp = sanitizePath("/reports/2026/Q3 summary.xlsx", allowedExtensions_);
    EXPECT_EQ(sp.remotePath, "/reports/2026/Q3 summary.xlsx");
    EXPECT_EQ(sp.fileName, "Q3 summary.xlsx");
    EXPECT_EQ(sp.extension, ".xlsx");
}


TEST_F(PathSanitizerTest, ExtensionCaseInsensitive)
{
    const SanitizedPath sp = sanitizePath("/data/EXPORT.CSV", allowedExtensions_);
    EXPECT_EQ(sp.fileName, "EXPORT.CSV");
    EXPECT_EQ(sp.extension, ".csv");
}


TEST_F(PathSanitizerTest, CurrentDirSegmentsDropped)
{
    EXPECT_EQ(sanitizePath("/./data/./list.txt", allowedExtensions_).remotePath, "/data/list.txt");
}


TEST_F(PathSanitizerTest, NonAsciiNamesAllowed)
{
    const SanitizedPath sp = sanitizePath("/отчеты/данные.csv", allowedExtensions_);
    EXPECT_EQ(sp.fileName, "данные.csv");
}


TEST_F(PathSanitizerTest, TraversalRejected)
{
    EXPECT_EQ(getIssue("/reports/../../etc/passwd"), ValidationIssue::pathTraversal);
    EXPECT_EQ(getIssue("../secret.txt"),             ValidationIssue::pathTraversal); //before the absolute-path check
    EXPECT_EQ(getIssue("/data/.."),                  ValidationIssue::pathTraversal);

    //traversal wins over invalid characters elsewhere in the path
    EXPECT_EQ(getIssue("/reports/../etc\\passwd.txt"),                     ValidationIssue::pathTraversal);
    EXPECT_EQ(getIssue("/reports/../x\x01.txt"),                           ValidationIssue::pathTraversal);
    EXPECT_EQ(getIssue(std::string_view("/reports/../a\0b.txt", 19)),    ValidationIssue::pathTraversal);
    EXPECT_EQ(getIssue("/reports/..//x;y.txt"),                            ValidationIssue::pathTraversal);
}


TEST_F(PathSanitizerTest, InvalidInput)
{
    EXPECT_EQ(getIssue(""), ValidationIssue::emptyPath);
    EXPECT_EQ(getIssue("relative/list.txt"),        ValidationIssue::invalidCharacters);
    EXPECT_EQ(getIssue("/data\\list.txt"),          ValidationIssue::invalidCharacters);
    EXPECT_EQ(getIssue("/data//list.txt"),          ValidationIssue::invalidCharacters);
    EXPECT_EQ(getIssue("/data/list;rm -rf.txt"),    ValidationIssue::invalidCharacters);
    EXPECT_EQ(getIssue(std::string_view("/a\0b.txt", 8)), ValidationIssue::invalidCharacters);
    EXPECT_EQ(getIssue("/data/\nlist.txt"),         ValidationIssue::invalidCharacters);
}


TEST_F(PathSanitizerTest, FileNameRequired)
{
    EXPECT_EQ(getIssue("/"),        ValidationIssue::missingFileName);
    EXPECT_EQ(getIssue("/reports/"), ValidationIssue::missingFileName);
    EXPECT_EQ(getIssue("/reports/."), ValidationIssue::missingFileName);
}


TEST_F(PathSanitizerTest, ExtensionAllowList)
{
    EXPECT_EQ(getIssue("/bin/tool.exe"),   ValidationIssue::invalidExtension);
    EXPECT_EQ(getIssue("/data/README"),    ValidationIssue::invalidExtension);
    EXPECT_EQ(getIssue("/home/.profile"),  ValidationIssue::invalidExtension);
    EXPECT_EQ(getIssue("/data/list.txt."), ValidationIssue::invalidExtension);
}


TEST_F(PathSanitizerTest, GetFileExtension)
{
    EXPECT_EQ(getFileExtension("report.XLSX"), ".xlsx");
    EXPECT_EQ(getFileExtension("archive.tar.gz"), ".gz");
    EXPECT_EQ(getFileExtension(".profile"), "");
    EXPECT_EQ(getFileExtension("README"), "");
    EXPECT_EQ(getFileExtension("file."), "");
}

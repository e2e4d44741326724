// *****************************************************************************
// * This file is part of the SafeMove project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SafeMove developers                                         *
// *****************************************************************************

#ifndef FILE_PATH_H_3984678473567247567
#define FILE_PATH_H_3984678473567247567

#include <optional>
#include "string_tools.h"


namespace basis
{
const char FILE_NAME_SEPARATOR = '/';

std::optional<std::string> getParentFolderPath(const std::string& itemPath); //no value for "/" or relative names
inline std::string getItemName(const std::string& itemPath) { return afterLast(itemPath, std::string(1, FILE_NAME_SEPARATOR), IfNotFoundReturn::all); }

std::string getFileExtension(std::string_view filePath); //without dot; empty if none

std::string appendSeparator(std::string path); //support rvalue references!

std::string appendPath(const std::string& basePath, const std::string& relPath);

//absolute, lexically normalized path: no "." or ".." components, no duplicate or trailing separators; symlinks are NOT resolved
std::string getNormalizedPath(const std::string& itemPath); //throw SysError (getcwd)

//"parentPath" contains "itemPath"? (both expected to be normalized)
bool isPathWithin(const std::string& itemPath, const std::string& parentPath);

//precondition: isPathWithin(itemPath, basePath)
std::string getRelativePath(const std::string& itemPath, const std::string& basePath);

std::optional<std::string> getEnvironmentVar(const char* name);
}

#endif //FILE_PATH_H_3984678473567247567

// *****************************************************************************
// * This file is part of the SafeMove project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SafeMove developers                                         *
// *****************************************************************************

#include "file_path.h"
#include <cstdlib> //getenv
#include <memory>
#include <unistd.h> //getcwd
#include "sys_error.h"

using namespace basis;


std::optional<std::string> basis::getParentFolderPath(const std::string& itemPath)
{
    if (!startsWith(itemPath, "/") || itemPath == "/")
        return std::nullopt;

    const std::string parentPath = beforeLast(itemPath, "/", IfNotFoundReturn::none);
    if (parentPath.empty())
        return "/";
    return parentPath;
}


std::string basis::getFileExtension(std::string_view filePath)
{
    const std::string fileName = afterLast(filePath, "/", IfNotFoundReturn::all);
    if (startsWith(fileName, ".") && std::count(fileName.begin(), fileName.end(), '.') == 1) //hidden file without extension
        return std::string();
    return afterLast(fileName, ".", IfNotFoundReturn::none);
}


std::string basis::appendSeparator(std::string path) //support rvalue references!
{
    if (!endsWith(path, "/"))
        path += FILE_NAME_SEPARATOR;
    return path; //returning a by-value parameter => RVO if possible, r-value otherwise!
}


std::string basis::appendPath(const std::string& basePath, const std::string& relPath)
{
    assert(!startsWith(relPath, "/") && !endsWith(relPath, "/"));
    if (relPath.empty())
        return basePath;

    if (basePath.empty())
        return relPath;

    if (endsWith(basePath, "/"))
        return basePath + relPath;

    return basePath + FILE_NAME_SEPARATOR + relPath;
}


std::string basis::getNormalizedPath(const std::string& itemPath) //throw SysError
{
    std::string absPath = itemPath;
    if (!startsWith(itemPath, "/"))
    {
        std::unique_ptr<char, decltype(&std::free)> cwd(::getcwd(nullptr, 0), std::free); //glibc extension: allocates buffer
        if (!cwd)
            THROW_LAST_SYS_ERROR("getcwd");
        absPath = std::string(cwd.get()) + FILE_NAME_SEPARATOR + itemPath;
    }

    std::vector<std::string> components;
    for (const std::string& comp : splitCpy(absPath, FILE_NAME_SEPARATOR, SplitOnEmpty::skip))
        if (comp == ".")
            ;
        else if (comp == "..")
        {
            if (!components.empty()) //"/.." == "/"
                components.pop_back();
        }
        else
            components.push_back(comp);

    std::string output;
    for (const std::string& comp : components)
        output += FILE_NAME_SEPARATOR + comp;

    return output.empty() ? std::string(1, FILE_NAME_SEPARATOR) : output;
}


bool basis::isPathWithin(const std::string& itemPath, const std::string& parentPath)
{
    return itemPath == parentPath || startsWith(itemPath, appendSeparator(parentPath));
}


std::string basis::getRelativePath(const std::string& itemPath, const std::string& basePath)
{
    assert(isPathWithin(itemPath, basePath));
    if (itemPath.size() <= basePath.size())
        return std::string();

    std::string relPath = itemPath.substr(basePath.size());
    if (startsWith(relPath, "/"))
        relPath.erase(0, 1);
    return relPath;
}


std::optional<std::string> basis::getEnvironmentVar(const char* name)
{
    const char* buffer = ::getenv(name); //no extended error reporting
    if (!buffer)
        return {};

    std::string value(buffer);

    //some postprocessing (good idea!? Is this even needed!?
    value = trimCpy(value);
    if (value.size() >= 2 && startsWith(value, "\"") && endsWith(value, "\"")) //remove leading, trailing double-quotes
        value = value.substr(1, value.size() - 2);

    return value;
}

// *****************************************************************************
// * This file is part of the SafeMove project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SafeMove developers                                         *
// *****************************************************************************

#include "config.h"
#include <sstream>
#include <utility>
#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/xml_parser.hpp>
#include <basis/file_io.h>

using namespace basis;
using namespace sm;
namespace pt = boost::property_tree;


namespace
{
//-------------------------------------------------------------------------------------------------------------------------------
const int XML_FORMAT_MOVE_CFG = 1; //2024-06-02

const char XML_ROOT_NAME[] = "SafeMove";
//-------------------------------------------------------------------------------------------------------------------------------

bool readText(const std::string& input, std::string& value)
{
    value = input;
    return true;
}


bool readText(const std::string& input, bool& value)
{
    if (equalAsciiNoCase(input, "true"))
        value = true;
    else if (equalAsciiNoCase(input, "false"))
        value = false;
    else
        return false;
    return true;
}


template <class Num>
bool readText(const std::string& input, Num& value)
{
    static_assert(std::is_arithmetic_v<Num>);
    return tryStringTo(input, value);
}


template <class Rep, class Period>
bool readText(const std::string& input, std::chrono::duration<Rep, Period>& value)
{
    Rep count = 0;
    if (!tryStringTo(input, count) || count < 0)
        return false;
    value = std::chrono::duration<Rep, Period>(count);
    return true;
}


bool readText(const std::string& input, DurabilityLevel& value)
{
    if (const std::optional<DurabilityLevel> level = parseDurabilityLevel(input))
    {
        value = *level;
        return true;
    }
    return false;
}


bool readText(const std::string& input, TransferMethod& value)
{
    if (const std::optional<TransferMethod> method = parseTransferMethod(input))
    {
        value = *method;
        return true;
    }
    return false;
}


//missing elements are fine, unreadable ones are recorded
class XmlIn
{
public:
    explicit XmlIn(const pt::ptree& node) : node_(node) {}

    template <class T>
    void operator()(const std::string& path, T& value)
    {
        knownNames_.insert(beforeFirst(path, ".", IfNotFoundReturn::all));
        if (const boost::optional<const pt::ptree&> child = node_.get_child_optional(path))
            if (!readText(trimCpy(child->data()), value))
                failedPaths_.push_back(path);
    }

    void extensions(const std::string& path, std::set<std::string>& value)
    {
        knownNames_.insert(path);
        if (const boost::optional<const pt::ptree&> child = node_.get_child_optional(path))
        {
            value.clear();
            for (const auto& [name, item] : *child)
                if (name == "Item")
                    value.insert(trimCpy(item.data()));
                else if (name != "<xmlcomment>")
                    failedPaths_.push_back(path + '.' + name);
        }
    }

    //unreadable values + elements never asked for
    std::vector<std::string> getErrors() const
    {
        std::vector<std::string> errors = failedPaths_;
        for (const auto& [name, child] : node_)
            if (name != "<xmlattr>" && name != "<xmlcomment>" && !knownNames_.contains(name))
                errors.push_back(name);
        return errors;
    }

private:
    const pt::ptree& node_;
    std::vector<std::string> failedPaths_;
    std::set<std::string> knownNames_;
};
}


std::pair<MoveSettings, std::string /*warningMsg*/> sm::readConfig(const std::string& filePath, const MoveSettings& defaults) //throw FileError
{
    const std::string stream = getFileContent(filePath); //throw FileError

    pt::ptree doc;
    try
    {
        std::istringstream is(stream);
        pt::read_xml(is, doc, pt::xml_parser::trim_whitespace);
    }
    catch (const pt::xml_parser_error& e)
    {
        throw FileError(replaceCpy("Configuration file %x is corrupted.", "%x", fmtPath(filePath)),
                        replaceCpy("Error parsing XML (line %x).", "%x", numberTo<std::string>(e.line())) + '\n' + e.message());
    }

    const boost::optional<const pt::ptree&> root = std::as_const(doc).get_child_optional(XML_ROOT_NAME);
    if (!root)
        throw FileError(replaceCpy("File %x does not contain a valid configuration.", "%x", fmtPath(filePath)));

    int formatVer = 0;
    if (!tryStringTo(root->get<std::string>("<xmlattr>.XmlFormat", "0"), formatVer) || formatVer < 1)
        throw FileError(replaceCpy("File %x does not contain a valid configuration.", "%x", fmtPath(filePath)));
    if (formatVer > XML_FORMAT_MOVE_CFG)
        throw FileError(replaceCpy("Configuration file %x was created by a newer version of SafeMove.", "%x", fmtPath(filePath)));

    MoveSettings cfg = defaults;
    XmlIn in(*root);

    in("Source",  cfg.sourceRoot);
    in("Target",  cfg.targetRoot);
    in("Journal", cfg.journalFolderPath);
    in("Staging", cfg.stagingFolderPath);
    in("LogFile", cfg.logFilePath);

    in("Workers",        cfg.workerCount);
    in("ChunkSize",      cfg.chunkSize);
    in("Digest",         cfg.digestAlgorithm);
    in("MaxRetries",     cfg.maxRetries);
    in("Durability",     cfg.durability);
    in("TransferMethod", cfg.transferMethod);
    in.extensions("Extensions", cfg.extensionFilter);

    in("KeepSourceFolderName", cfg.keepSourceFolderName);
    in("PruneEmptyFolders",    cfg.pruneEmptySourceFolders);
    in("MinFreeSpace",         cfg.minFreeSpace);
    in("StallTimeout",         cfg.stallTimeout);

    in("JournalBatch.<xmlattr>.MaxCommits", cfg.batchMaxCommits);
    in("JournalBatch.<xmlattr>.MaxDelay",   cfg.batchMaxDelay);

    const std::vector<std::string> warnPaths = in.getErrors();

    std::string warningMsg;
    if (!warnPaths.empty())
    {
        warningMsg = replaceCpy("Configuration file %x contains invalid or unknown elements. They are ignored:", "%x", fmtPath(filePath)) + '\n';
        for (const std::string& path : warnPaths)
            warningMsg += "    " + replaceCpy(path, "<xmlattr>.", "") + '\n';
    }
    return {cfg, trimCpy(warningMsg)};
}

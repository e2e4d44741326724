// *****************************************************************************
// * This file is part of the SafeMove project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SafeMove developers                                         *
// *****************************************************************************

#include "command_line.h"
#include <algorithm>
#include <limits>
#include "base/verifier.h"
#include "config.h"

using namespace basis;
using namespace sm;


namespace
{
const char optionResume    [] = "--resume";
const char optionWorkers   [] = "--workers";
const char optionChunkSize [] = "--chunk-size";
const char optionDigest    [] = "--digest";
const char optionDryRun    [] = "--dry-run";
const char optionMaxRetries[] = "--max-retries";
const char optionDurability[] = "--durability";
const char optionConfig    [] = "--config";
const char optionJournal   [] = "--journal";
const char optionExt       [] = "--ext";
const char optionKeepSourceDirName[] = "--keep-source-dir-name";
const char optionLogFile   [] = "--log-file";
const char optionStaging   [] = "--staging";
const char optionTransfer  [] = "--transfer";
const char optionMinFree   [] = "--min-free-space";
const char optionKeepEmptyDirs[] = "--keep-empty-dirs";
const char optionVerbose   [] = "--verbose";


bool isHelpRequest(const std::string& arg)
{
    auto it = std::find_if(arg.begin(), arg.end(), [](char c) { return c != '/' && c != '-'; });
    if (it == arg.begin()) return false; //require at least one prefix character

    const std::string argTmp(it, arg.end());
    return equalAsciiNoCase(argTmp, "help") ||
           equalAsciiNoCase(argTmp, "h")    ||
           argTmp == "?";
}


bool isCommandLineOption(const std::string& arg)
{
    return startsWith(arg, "-") && arg != "-";
}


template <class Num>
Num parseCount(const std::string& option, const std::string& value) //throw FileError
{
    Num number = 0;
    if (!tryStringTo(value, number) || value.find('-') != std::string::npos)
        throw FileError(replaceCpy(replaceCpy("Invalid value %y for %x.", "%x", option), "%y", fmtPath(value)), "A non-negative number is expected.");
    return number;
}
}


std::optional<uint64_t> sm::parseByteCount(std::string_view str)
{
    std::string numStr = trimCpy(str);
    uint64_t factor = 1;
    if (!numStr.empty())
        switch (asciiToLower(numStr.back()))
        {
            //*INDENT-OFF*
            case 'k': factor = 1ULL << 10; numStr.pop_back(); break;
            case 'm': factor = 1ULL << 20; numStr.pop_back(); break;
            case 'g': factor = 1ULL << 30; numStr.pop_back(); break;
            case 't': factor = 1ULL << 40; numStr.pop_back(); break;
            //*INDENT-ON*
        }

    uint64_t number = 0;
    if (!tryStringTo(numStr, number))
        return std::nullopt;

    if (number > std::numeric_limits<uint64_t>::max() / factor)
        return std::nullopt;
    return number * factor;
}


CommandLine sm::parseCommandLine(const std::vector<std::string>& args) //throw FileError
{
    CommandLine cmdLine;

    auto getOptionValue = [&](auto& it) -> const std::string& //throw FileError
    {
        const std::string& option = *it;
        if (++it == args.end() || isCommandLineOption(*it))
            throw FileError(replaceCpy("A value is expected after %x.", "%x", option));
        return *it;
    };

    //config file first: switches take precedence regardless of order
    for (auto it = args.begin(); it != args.end(); ++it)
        if (isHelpRequest(*it))
        {
            cmdLine.showHelp = true;
            return cmdLine;
        }
        else if (*it == optionConfig)
        {
            const std::string& cfgFilePath = getOptionValue(it); //throw FileError
            std::tie(cmdLine.settings, cmdLine.configWarning) = readConfig(cfgFilePath, cmdLine.settings); //throw FileError
        }

    MoveSettings& s = cmdLine.settings;
    std::vector<std::string> folderPaths;

    for (auto it = args.begin(); it != args.end(); ++it)
    {
        const std::string& arg = *it;

        if (arg == optionConfig)
            ++it; //already evaluated
        else if (arg == optionResume)
            s.resumeOnly = true;
        else if (arg == optionDryRun)
            s.dryRun = true;
        else if (arg == optionKeepSourceDirName || arg == "-s")
            s.keepSourceFolderName = true;
        else if (arg == optionKeepEmptyDirs)
            s.pruneEmptySourceFolders = false;
        else if (arg == optionVerbose || arg == "-v")
            cmdLine.verbose = true;
        else if (arg == optionWorkers)
        {
            s.workerCount = parseCount<size_t>(arg, getOptionValue(it)); //throw FileError
            if (s.workerCount == 0)
                throw FileError(replaceCpy(replaceCpy("Invalid value %y for %x.", "%x", arg), "%y", "0"), "At least one worker is required.");
        }
        else if (arg == optionChunkSize)
        {
            const std::string& value = getOptionValue(it); //throw FileError
            const std::optional<uint64_t> chunkSize = parseByteCount(value);
            if (!chunkSize || *chunkSize == 0 || *chunkSize > std::numeric_limits<uint32_t>::max())
                throw FileError(replaceCpy(replaceCpy("Invalid value %y for %x.", "%x", arg), "%y", fmtPath(value)), "Example: 4M");
            s.chunkSize = static_cast<size_t>(*chunkSize);
        }
        else if (arg == optionMinFree)
        {
            const std::string& value = getOptionValue(it); //throw FileError
            const std::optional<uint64_t> minFree = parseByteCount(value);
            if (!minFree)
                throw FileError(replaceCpy(replaceCpy("Invalid value %y for %x.", "%x", arg), "%y", fmtPath(value)), "Example: 10G");
            s.minFreeSpace = *minFree;
        }
        else if (arg == optionDigest)
        {
            s.digestAlgorithm = asciiToLowerCpy(getOptionValue(it)); //throw FileError
            if (!isSupportedDigest(s.digestAlgorithm))
                throw FileError(replaceCpy(replaceCpy("Invalid value %y for %x.", "%x", arg), "%y", fmtPath(s.digestAlgorithm)),
                                "Digest algorithm is not available.");
        }
        else if (arg == optionMaxRetries)
            s.maxRetries = parseCount<int>(arg, getOptionValue(it)); //throw FileError
        else if (arg == optionDurability)
        {
            const std::string& value = getOptionValue(it); //throw FileError
            const std::optional<DurabilityLevel> level = parseDurabilityLevel(value);
            if (!level)
                throw FileError(replaceCpy(replaceCpy("Invalid value %y for %x.", "%x", arg), "%y", fmtPath(value)), "Expected: none, flushed, fsynced");
            s.durability = *level;
        }
        else if (arg == optionTransfer)
        {
            const std::string& value = getOptionValue(it); //throw FileError
            const std::optional<TransferMethod> method = parseTransferMethod(value);
            if (!method)
                throw FileError(replaceCpy(replaceCpy("Invalid value %y for %x.", "%x", arg), "%y", fmtPath(value)), "Expected: auto, stream, zerocopy");
            s.transferMethod = *method;
        }
        else if (arg == optionJournal)
            s.journalFolderPath = getOptionValue(it); //throw FileError
        else if (arg == optionStaging)
            s.stagingFolderPath = getOptionValue(it); //throw FileError
        else if (arg == optionLogFile)
            s.logFilePath = getOptionValue(it); //throw FileError
        else if (arg == optionExt)
        {
            //"--ext jpg,png --ext .mp4"
            for (const std::string& ext : splitCpy(getOptionValue(it) /*throw FileError*/, ',', SplitOnEmpty::skip))
                s.extensionFilter.insert(ext);
        }
        else if (isCommandLineOption(arg))
            throw FileError(replaceCpy("Unknown command line option %x.", "%x", fmtPath(arg)));
        else
            folderPaths.push_back(arg);
    }

    if (folderPaths.size() > 2)
        throw FileError("Too many folder paths.", replaceCpy("Unexpected argument %x.", "%x", fmtPath(folderPaths[2])));
    if (folderPaths.size() == 1)
        throw FileError("A source and a destination folder path are expected.");
    if (folderPaths.size() == 2)
    {
        s.sourceRoot = folderPaths[0];
        s.targetRoot = folderPaths[1];
    }
    return cmdLine;
}


std::string sm::getSyntaxHelp()
{
    return
        "Syntax:\n"
        "    SafeMove [options] <source> <destination>\n"
        "\n"
        "Moves all files from <source> to <destination>. Each file is copied, verified and synced\n"
        "before the original is removed. Interrupted runs continue where they left off.\n"
        "\n"
        "Options:\n"
        "    --resume                 Only continue files recorded by a previous run\n"
        "    --dry-run                Show what would be moved without changing anything\n"
        "    --workers <n>            Number of parallel workers (one per destination device)\n"
        "    --chunk-size <size>      Copy buffer size, e.g. 4M (default: 1M)\n"
        "    --digest <name>          Content digest: sha256, sha512, sha3-256, blake2b512, sha1, md5\n"
        "    --max-retries <n>        Attempts per file before it fails permanently (default: 3)\n"
        "    --durability <level>     Journal durability: none, flushed, fsynced (default: fsynced)\n"
        "    --transfer <method>      Copy method: auto, stream, zerocopy (default: auto)\n"
        "    --config <file>          Read settings from XML file; options override the file\n"
        "    --journal <folder>       Journal location (default: <destination>/.safemove)\n"
        "    --staging <folder>       Create temporary files in this folder\n"
        "    --ext <list>             Move only files with these extensions, e.g. jpg,png\n"
        "    --min-free-space <size>  Keep at least this much space free on the destination (default: 5G)\n"
        "    --keep-source-dir-name   Move <source>/X to <destination>/<source name>/X\n"
        "    --keep-empty-dirs        Don't remove source folders left empty\n"
        "    --log-file <file>        Append run log to this file (default: <journal>/safemove.log)\n"
        "    --verbose                Show info messages, not only warnings and errors\n"
        "\n"
        "Exit codes:\n"
        "    0  all files moved\n"
        "    1  files failed or were left pending\n"
        "    2  fatal error (run lock held, journal unavailable, invalid configuration)\n";
}

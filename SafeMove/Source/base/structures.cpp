// *****************************************************************************
// * This file is part of the SafeMove project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SafeMove developers                                         *
// *****************************************************************************

#include "structures.h"
#include <cassert>
#include <basis/file_path.h>

using namespace basis;
using namespace sm;


std::string sm::getStageName(Stage stage)
{
    switch (stage)
    {
        case Stage::init:              return "INIT";
        case Stage::openTemp:          return "OPEN_TEMP";
        case Stage::streamCopy:        return "STREAM_COPY";
        case Stage::flushed:           return "FLUSHED";
        case Stage::dataSynced:        return "DATA_SYNCED";
        case Stage::hashed:            return "HASHED";
        case Stage::verified:          return "VERIFIED";
        case Stage::renamed:           return "RENAMED";
        case Stage::destDirSynced:     return "DEST_DIR_SYNCED";
        case Stage::sourceRemoved:     return "SOURCE_REMOVED";
        case Stage::sourceDirSynced:   return "SOURCE_DIR_SYNCED";
        case Stage::done:              return "DONE";
        case Stage::failed:            return "FAILED";
        case Stage::permanentlyFailed: return "PERMANENTLY_FAILED";
    }
    assert(false);
    return "STAGE_" + numberTo<std::string>(static_cast<int>(stage));
}


std::string sm::getDurabilityName(DurabilityLevel level)
{
    switch (level)
    {
        case DurabilityLevel::none:
            return "none";
        case DurabilityLevel::flushed:
            return "flushed";
        case DurabilityLevel::fsynced:
            return "fsynced";
    }
    assert(false);
    return std::string();
}


std::optional<DurabilityLevel> sm::parseDurabilityLevel(std::string_view name)
{
    for (const DurabilityLevel level : {DurabilityLevel::none, DurabilityLevel::flushed, DurabilityLevel::fsynced})
        if (equalAsciiNoCase(name, getDurabilityName(level)))
            return level;
    return std::nullopt;
}


std::string sm::getTransferMethodName(TransferMethod method)
{
    switch (method)
    {
        case TransferMethod::automatic:
            return "auto";
        case TransferMethod::stream:
            return "stream";
        case TransferMethod::zeroCopy:
            return "zerocopy";
    }
    assert(false);
    return std::string();
}


std::optional<TransferMethod> sm::parseTransferMethod(std::string_view name)
{
    for (const TransferMethod method : {TransferMethod::automatic, TransferMethod::stream, TransferMethod::zeroCopy})
        if (equalAsciiNoCase(name, getTransferMethodName(method)))
            return method;
    return std::nullopt;
}


std::string sm::getJournalFolderPath(const MoveSettings& settings)
{
    if (!settings.journalFolderPath.empty())
        return settings.journalFolderPath;
    return appendPath(settings.targetRoot, DEFAULT_JOURNAL_FOLDER_NAME);
}


std::string sm::getLogFilePath(const MoveSettings& settings)
{
    if (!settings.logFilePath.empty())
        return settings.logFilePath;
    return appendPath(getJournalFolderPath(settings), "safemove.log");
}

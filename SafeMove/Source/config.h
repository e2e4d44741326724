// *****************************************************************************
// * This file is part of the SafeMove project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SafeMove developers                                         *
// *****************************************************************************

#ifndef CONFIG_H_28345825704254262435
#define CONFIG_H_28345825704254262435

#include <basis/file_error.h>
#include "base/structures.h"


namespace sm
{
/*  XML configuration file:

    <SafeMove XmlFormat="1">
        <Source>/mnt/old</Source>
        <Target>/mnt/new</Target>
        <Journal/>
        <Staging/>
        <LogFile/>
        <Workers>1</Workers>
        <ChunkSize>1048576</ChunkSize>
        <Digest>sha256</Digest>
        <MaxRetries>3</MaxRetries>
        <Durability>fsynced</Durability>
        <TransferMethod>auto</TransferMethod>
        <Extensions>
            <Item>jpg</Item>
        </Extensions>
        <KeepSourceFolderName>false</KeepSourceFolderName>
        <PruneEmptyFolders>true</PruneEmptyFolders>
        <MinFreeSpace>5368709120</MinFreeSpace>
        <StallTimeout>120</StallTimeout>
        <JournalBatch MaxCommits="64" MaxDelay="2000"/>
    </SafeMove>

    - missing elements keep the values passed in "defaults"
    - unknown elements and unreadable values are reported as warning, not as error  */
std::pair<MoveSettings, std::string /*warningMsg*/> readConfig(const std::string& filePath, const MoveSettings& defaults); //throw FileError
}

#endif //CONFIG_H_28345825704254262435

// *****************************************************************************
// * This file is part of the SafeMove project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SafeMove developers                                         *
// *****************************************************************************

#ifndef STRUCTURES_H_8210478915019450901745
#define STRUCTURES_H_8210478915019450901745

#include <chrono>
#include <optional>
#include <set>
#include <string>
#include <basis/string_tools.h>


namespace sm
{
//per-file migration state machine: persisted as int8 => never reorder!
enum class Stage : int8_t
{
    init,
    openTemp,
    streamCopy,
    flushed,
    dataSynced,
    hashed,
    verified,
    renamed,
    destDirSynced,
    sourceRemoved,
    sourceDirSynced,
    done,
    failed,
    permanentlyFailed,
};

std::string getStageName(Stage stage); //"STREAM_COPY"

inline bool isTerminal(Stage stage) { return stage == Stage::done || stage == Stage::permanentlyFailed; }

//stages along the success path may be compared by order: failed/permanentlyFailed are not part of it!
inline bool isForwardStage(Stage stage) { return stage <= Stage::done; }


enum class DurabilityLevel
{
    none,    //kept in process memory until the next flush: lost on process crash
    flushed, //handed to the OS: survives a process crash, not a power loss
    fsynced, //on stable storage
};

std::string getDurabilityName(DurabilityLevel level);
std::optional<DurabilityLevel> parseDurabilityLevel(std::string_view name);


enum class TransferMethod
{
    automatic, //kernel copy on the same device, user space stream otherwise
    stream,    //read + write through a user space buffer
    zeroCopy,  //always try the kernel copy first (cross-device is allowed since Linux 5.3)
};

std::string getTransferMethodName(TransferMethod method);
std::optional<TransferMethod> parseTransferMethod(std::string_view name);


using EntryId = uint64_t;

struct WorkItem
{
    std::string sourcePath; //absolute, normalized
    std::string targetPath; //
    uint64_t fileSize  = 0; //at scan time
    time_t modTime     = 0; //
    time_t discoveredAt = 0;
    std::string expectedDigest; //optional: hex, empty if unknown
};


struct JournalEntry
{
    EntryId id = 0;
    std::string sourcePath;
    std::string targetPath; //chosen when the entry was created: may differ from the mirrored path after a name collision
    uint64_t fileSize = 0;
    time_t modTime = 0;

    Stage stage = Stage::init;
    uint64_t bytesCopied = 0;
    std::string contentDigest;  //hex; during STREAM_COPY: digest of the first "bytesCopied" bytes
    std::string digestAlgorithm;
    int retryCount = 0;
    std::string lastError;
    time_t updatedAt = 0;
    time_t discoveredAt = 0;
    bool nonAtomicSwap = false; //cross-device fallback: verified durable copy, but no atomic rename
    bool targetAdopted = false; //identical target existed before: never written, never deleted by this entry
    std::string expectedDigest;
};


//optional field updates passed along with a stage commit
struct EntryFields
{
    std::optional<uint64_t>    bytesCopied;
    std::optional<std::string> contentDigest;
    std::optional<int>         retryCount;
    std::optional<std::string> lastError;
    std::optional<bool>        nonAtomicSwap;
    std::optional<bool>        targetAdopted;
    std::optional<std::string> targetPath;
};


const char TEMP_FILE_ENDING[] = ".sm_tmp"; //reserved: never migrated, never a target name
const char DEFAULT_JOURNAL_FOLDER_NAME[] = ".safemove";


struct MoveSettings
{
    std::string sourceRoot;
    std::string targetRoot;
    std::string journalFolderPath; //empty: <targetRoot>/.safemove
    std::string stagingFolderPath; //empty: temp files beside their target
    std::string logFilePath;       //empty: <journal folder>/safemove.log

    bool resumeOnly = false; //process journal entries only, no discovery of new files
    bool dryRun     = false;
    bool keepSourceFolderName = false; //<targetRoot>/<source folder name>/<relative path>
    bool pruneEmptySourceFolders = true;

    size_t workerCount = 1;
    size_t chunkSize   = 1024 * 1024;
    std::string digestAlgorithm = "sha256";
    int maxRetries = 3;
    DurabilityLevel durability = DurabilityLevel::fsynced;
    TransferMethod transferMethod = TransferMethod::automatic;
    std::set<std::string> extensionFilter; //lower case, without dot; empty: all files

    uint64_t minFreeSpace = 5ULL << 30; //keep >= 5 GiB free on the target

    //journal commit batching for non-destructive updates
    size_t batchMaxCommits = 64;
    std::chrono::milliseconds batchMaxDelay{2000};

    size_t scanBatchSize = 1000;

    std::chrono::seconds stallTimeout{120}; //fsync or chunk I/O exceeding this => TransientIOError
    int transientRetries = 2; //in-run retries of transient errors before deferring the item
    std::chrono::milliseconds transientRetryDelay{500}; //doubled per attempt

    std::chrono::seconds checkpointInterval{10};
};

std::string getJournalFolderPath(const MoveSettings& settings);
std::string getLogFilePath(const MoveSettings& settings);
}

#endif //STRUCTURES_H_8210478915019450901745

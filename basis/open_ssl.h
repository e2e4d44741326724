// *****************************************************************************
// * This file is part of the SafeMove project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SafeMove developers                                         *
// *****************************************************************************

#ifndef OPEN_SSL_H_801974580936508934568792347506
#define OPEN_SSL_H_801974580936508934568792347506

#include <memory>
#include "sys_error.h"

using EVP_MD_CTX = struct evp_md_ctx_st; //avoid <openssl/evp.h> in header


namespace basis
{
//init OpenSSL on main thread before use!
void openSslInit();

//algorithm names as known to EVP_get_digestbyname(), e.g. "sha256", "sha3-256", "blake2b512"
bool isDigestAvailable(const std::string& algorithm);


//incremental message digest: copyable, so that the digest of a prefix can be taken mid-stream
class HashContext
{
public:
    explicit HashContext(const std::string& algorithm); //throw SysError
    HashContext(const HashContext& other); //throw SysError
    HashContext& operator=(const HashContext& other); //throw SysError
    HashContext(HashContext&& tmp) noexcept = default;
    HashContext& operator=(HashContext&& tmp) noexcept = default;
    ~HashContext();

    void update(const void* buffer, size_t bytes); //throw SysError
    void update(std::string_view bytes) { update(bytes.data(), bytes.size()); } //throw SysError
    void updateZeros(uint64_t count); //throw SysError; holes of sparse files read as zeros

    //non-destructive: context may be updated further
    std::string finalizeHex() const; //throw SysError

    const std::string& getAlgorithm() const { return algorithm_; }

private:
    struct CtxDeleter { void operator()(EVP_MD_CTX* ctx) const; };

    std::string algorithm_;
    std::unique_ptr<EVP_MD_CTX, CtxDeleter> ctx_;
};
}

#endif //OPEN_SSL_H_801974580936508934568792347506

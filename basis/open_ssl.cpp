// *****************************************************************************
// * This file is part of the SafeMove project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SafeMove developers                                         *
// *****************************************************************************

#include "open_ssl.h"
#include "extra_log.h"
#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/evp.h>

using namespace basis;


namespace
{
#ifndef OPENSSL_THREADS
    #error OpenSSL without thread support: digests are computed on worker threads!
#endif

static_assert(OPENSSL_VERSION_NUMBER >= 0x30000000L, "OpenSSL version is too old!");


std::string formatOpenSSLError(const char* functionName, unsigned long ec)
{
    char errorBuf[256] = {}; //== buffer size used by ERR_error_string()
    ::ERR_error_string_n(ec, errorBuf, sizeof(errorBuf)); //includes null-termination

    return formatSystemError(functionName, replaceCpy("Error code %x", "%x", numberTo<std::string>(ec)), errorBuf);
}


std::string formatLastOpenSSLError(const char* functionName)
{
    const auto ec = ::ERR_peek_last_error(); //latest error code from the thread's error queue, without modifying it
    ::ERR_clear_error(); //clean up for next OpenSSL operation on this thread
    return formatOpenSSLError(functionName, ec);
}


const EVP_MD* getDigestType(const std::string& algorithm) //throw SysError
{
    if (const EVP_MD* md = ::EVP_get_digestbyname(algorithm.c_str()))
        return md;

    throw SysError(formatLastOpenSSLError("EVP_get_digestbyname") + "\n" +
                   replaceCpy("Unknown digest algorithm %x.", "%x", '"' + algorithm + '"'));
}


struct OpenSslThreadCleanUp
{
    ~OpenSslThreadCleanUp()
    {
        ::OPENSSL_thread_stop();
    }
};
thread_local OpenSslThreadCleanUp tearDownOpenSslThreadData;
}


void basis::openSslInit()
{
    assert(runningOnMainThread());
    //explicitly init OpenSSL on main thread: avoid racing worker threads
    if (::OPENSSL_init_crypto(OPENSSL_INIT_ADD_ALL_DIGESTS | OPENSSL_INIT_NO_LOAD_CONFIG, nullptr) != 1)
        logExtraError("Error during process initialization.\n\n" + formatLastOpenSSLError("OPENSSL_init_crypto"));
}


bool basis::isDigestAvailable(const std::string& algorithm)
{
    if (::EVP_get_digestbyname(algorithm.c_str()))
        return true;
    ::ERR_clear_error();
    return false;
}


void HashContext::CtxDeleter::operator()(EVP_MD_CTX* ctx) const { ::EVP_MD_CTX_free(ctx); }


HashContext::HashContext(const std::string& algorithm) : //throw SysError
    algorithm_(algorithm),
    ctx_(::EVP_MD_CTX_new())
{
    if (!ctx_)
        throw SysError(formatLastOpenSSLError("EVP_MD_CTX_new"));

    if (::EVP_DigestInit_ex(ctx_.get(), getDigestType(algorithm), nullptr) != 1) //throw SysError
        throw SysError(formatLastOpenSSLError("EVP_DigestInit_ex"));
}


HashContext::HashContext(const HashContext& other) : //throw SysError
    algorithm_(other.algorithm_),
    ctx_(::EVP_MD_CTX_new())
{
    if (!ctx_)
        throw SysError(formatLastOpenSSLError("EVP_MD_CTX_new"));

    if (::EVP_MD_CTX_copy_ex(ctx_.get(), other.ctx_.get()) != 1)
        throw SysError(formatLastOpenSSLError("EVP_MD_CTX_copy_ex"));
}


HashContext& HashContext::operator=(const HashContext& other) //throw SysError
{
    HashContext tmp(other); //throw SysError
    return *this = std::move(tmp);
}


HashContext::~HashContext() {}


void HashContext::update(const void* buffer, size_t bytes) //throw SysError
{
    if (!ctx_)
        throw std::logic_error(std::string(__FILE__) + '[' + std::to_string(__LINE__) + "] Contract violation!"); //used after move

    if (bytes > 0)
        if (::EVP_DigestUpdate(ctx_.get(), buffer, bytes) != 1)
            throw SysError(formatLastOpenSSLError("EVP_DigestUpdate"));
}


void HashContext::updateZeros(uint64_t count) //throw SysError
{
    static const std::string zeroBlock(64 * 1024, '\0');

    while (count > 0)
    {
        const size_t blockSize = static_cast<size_t>(std::min<uint64_t>(count, zeroBlock.size()));
        update(zeroBlock.data(), blockSize); //throw SysError
        count -= blockSize;
    }
}


std::string HashContext::finalizeHex() const //throw SysError
{
    HashContext tmp(*this); //throw SysError

    unsigned char md[EVP_MAX_MD_SIZE] = {};
    unsigned int mdLen = 0;
    if (::EVP_DigestFinal_ex(tmp.ctx_.get(), md, &mdLen) != 1)
        throw SysError(formatLastOpenSSLError("EVP_DigestFinal_ex"));

    return formatAsHexString(std::string_view(reinterpret_cast<const char*>(md), mdLen)); //lower case
}

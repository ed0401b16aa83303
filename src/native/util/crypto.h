/* Copyright (C) 2016 NooBaa */
#pragma once

#include <openssl/err.h>
#include <openssl/evp.h>

#include "buf.h"
#include "common.h"

namespace dataid
{

class Crypto
{

public:
    static inline const EVP_MD*
    get_md(const char* digest_name)
    {
        const EVP_MD* md = EVP_get_digestbyname(digest_name);
        if (!md) {
            throw Exception(XSTR() << "Crypto: unknown digest " << digest_name);
        }
        return md;
    }

    static inline Buf
    digest(const Buf& buf, const char* digest_name)
    {
        Hasher hasher(digest_name);
        hasher.update(buf.data(), buf.length());
        return hasher.final();
    }

    /**
     * Hasher is an incremental digest over a stream of buffers.
     */
    class Hasher
    {
    public:
        explicit Hasher(const char* digest_name)
            : _md(get_md(digest_name))
            , _ctx(EVP_MD_CTX_new())
        {
            if (!_ctx || !EVP_DigestInit_ex(_ctx, _md, NULL)) {
                EVP_MD_CTX_free(_ctx);
                throw Exception(XSTR() << "Crypto: digest init failed " << DVAL(digest_name));
            }
        }

        Hasher(const Hasher&) = delete;
        Hasher& operator=(const Hasher&) = delete;

        ~Hasher()
        {
            EVP_MD_CTX_free(_ctx);
        }

        int size() const { return EVP_MD_size(_md); }

        void
        update(const uint8_t* data, int len)
        {
            if (len > 0 && !EVP_DigestUpdate(_ctx, data, len)) {
                throw Exception("Crypto: digest update failed");
            }
        }

        Buf
        final()
        {
            Buf digest(size());
            unsigned int digest_len = 0;
            if (!EVP_DigestFinal_ex(_ctx, digest.data(), &digest_len)) {
                throw Exception("Crypto: digest final failed");
            }
            digest.slice(0, digest_len);
            return digest;
        }

    private:
        const EVP_MD* _md;
        EVP_MD_CTX* _ctx;
    };
};

} // namespace dataid

#include "sha256hasherimpl.hpp"

#include <memory>

#include <glog/logging.h>
#include <openssl/evp.h>

namespace pshare::crypto
{
namespace
{
using DigestContext = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

DigestContext make_digest_context()
{
    DigestContext ctx {EVP_MD_CTX_new(), &EVP_MD_CTX_free};
    if (!ctx)
    {
        LOG(FATAL) << "EVP_MD_CTX_new failed";
    }
    if (!EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr))
    {
        LOG(FATAL) << "EVP_DigestInit_ex failed";
    }
    return ctx;
}

void update_digest(EVP_MD_CTX *ctx, const void *data, size_t len)
{
    if (!EVP_DigestUpdate(ctx, data, len))
    {
        LOG(FATAL) << "EVP_DigestUpdate failed";
    }
}

std::vector<SHA256Hasher::Byte> finalize_digest(EVP_MD_CTX *ctx)
{
    std::vector<SHA256Hasher::Byte> digest(EVP_MAX_MD_SIZE);
    unsigned int                    digest_len = 0;
    if (!EVP_DigestFinal_ex(ctx, digest.data(), &digest_len))
    {
        LOG(FATAL) << "EVP_DigestFinal_ex failed";
    }
    digest.resize(digest_len);
    return digest;
}
}  // namespace

std::vector<SHA256Hasher::Byte> SHA256HasherImpl::hash(const Byte *data, size_t len) const
{
    auto ctx = make_digest_context();
    update_digest(ctx.get(), data, len);
    return finalize_digest(ctx.get());
}

std::vector<SHA256Hasher::Byte> SHA256HasherImpl::hash(std::istream &is) const
{
    size_t bytes_read;
    return hash(is, bytes_read);
}

std::vector<SHA256Hasher::Byte> SHA256HasherImpl::hash(std::istream &is, size_t &bytes_read) const
{
    auto              ctx = make_digest_context();
    std::vector<char> buffer(read_buffer_size);

    bytes_read = 0;
    while (is)
    {
        is.read(buffer.data(), std::streamsize(buffer.size()));
        auto count = is.gcount();
        if (count > 0)
        {
            update_digest(ctx.get(), buffer.data(), size_t(count));
            bytes_read += size_t(count);
        }
    }

    if (is.bad() || !is.eof())
    {
        LOG(ERROR) << "Input stream failed before reaching its end";
        return {};
    }

    return finalize_digest(ctx.get());
}
}  // namespace pshare::crypto

#include "beacon/identity/certificate_directory.hpp"
#include "beacon/core/text_file.hpp"
#include "beacon/core/format.hpp"
#include "beacon/debug/identity_logger.hpp"
#include <mutex>
#include <system_error>
namespace beacon::node::identity {
namespace {
    constexpr size_t MAX_CERTIFICATE_FILE_SIZE = 1024 * 1024;

    bool HasCertificateExtension(const std::filesystem::path& path) {
        const auto extension = path.extension();
        return extension == ".pem" || extension == ".crt";
    }
}

CertificateDirectory::CertificateDirectory(CertificateDirectory&& other) noexcept {
    std::unique_lock lock(other.mutex_);
    records_ = std::move(other.records_);
}

Result<CertificateDirectory, BeaconFailure> CertificateDirectory::LoadFromDirectory(
    const std::filesystem::path& directory) {
    std::error_code ec;
    std::filesystem::directory_iterator it(directory, ec);
    if (ec) {
        return Result<CertificateDirectory, BeaconFailure>::Err(
            BeaconFailure::ConfigurationFailed(
                compat::format("Unable to read certificate directory {}: {}",
                               directory.string(), ec.message())));
    }
    CertificateDirectory result;
    for (const auto& entry : it) {
        if (!entry.is_regular_file(ec) || !HasCertificateExtension(entry.path())) {
            continue;
        }
        auto certificate = LoadCertificateFile(entry.path());
        if (certificate.IsErr()) {
            BCN_LOG_MSG("DIRECTORY", "skipping unparsable certificate file");
            continue;
        }
        auto inserted = result.Insert(certificate.Unwrap());
        if (inserted.IsErr()) {
            BCN_LOG_MSG("DIRECTORY", "skipping certificate without common name");
            continue;
        }
        BCN_LOG_VALUE("DIRECTORY", "loaded", inserted.Unwrap().Value());
    }
    return Result<CertificateDirectory, BeaconFailure>::Ok(std::move(result));
}

Result<Certificate, BeaconFailure> CertificateDirectory::LoadCertificateFile(
    const std::filesystem::path& file) {
    auto text = ReadTextFile(file, MAX_CERTIFICATE_FILE_SIZE);
    if (text.IsErr()) {
        return Result<Certificate, BeaconFailure>::Err(
            BeaconFailure::ConfigurationFailed(
                compat::format("Unable to load certificate from file {}: {}",
                               file.string(), text.UnwrapErr().message)));
    }
    return Certificate::FromPem(text.Unwrap());
}

Result<NodeId, BeaconFailure> CertificateDirectory::Insert(const Certificate& certificate) {
    auto common_name = certificate.CommonName();
    if (common_name.IsErr()) {
        return Result<NodeId, BeaconFailure>::Err(std::move(common_name).UnwrapErr());
    }
    auto node_id = NodeId::Create(common_name.Unwrap());
    if (node_id.IsErr()) {
        return Result<NodeId, BeaconFailure>::Err(std::move(node_id).UnwrapErr());
    }
    auto certificate_pem = certificate.ToPem();
    if (certificate_pem.IsErr()) {
        return Result<NodeId, BeaconFailure>::Err(std::move(certificate_pem).UnwrapErr());
    }
    auto public_key_pem = certificate.PublicKeyPem();
    if (public_key_pem.IsErr()) {
        return Result<NodeId, BeaconFailure>::Err(std::move(public_key_pem).UnwrapErr());
    }
    std::unique_lock lock(mutex_);
    records_.insert_or_assign(node_id.Unwrap(), DirectoryRecord{
        std::move(certificate_pem).Unwrap(),
        std::move(public_key_pem).Unwrap()});
    return node_id;
}

std::optional<DirectoryRecord> CertificateDirectory::Lookup(const NodeId& node_id) const {
    std::shared_lock lock(mutex_);
    const auto it = records_.find(node_id);
    if (it == records_.end()) {
        return std::nullopt;
    }
    return it->second;
}

size_t CertificateDirectory::Size() const {
    std::shared_lock lock(mutex_);
    return records_.size();
}

}

#pragma once
#include "beacon/core/result.hpp"
#include "beacon/core/failures.hpp"
#include "beacon/crypto/certificate.hpp"
#include "beacon/identity/directory_lookup.hpp"
#include <filesystem>
#include <map>
#include <optional>
#include <shared_mutex>
namespace beacon::node::identity {
using crypto::Certificate;

/**
 * @brief IDirectoryLookup over certificates held locally.
 *
 * Certificates are indexed by subject common name, which must equal the
 * node id. Used for pre-provisioned deployments and as the in-process
 * directory in tests.
 */
class CertificateDirectory final : public IDirectoryLookup {
public:
    CertificateDirectory() = default;

    /**
     * Loads every *.pem and *.crt file of @p directory. Files that hold no
     * parsable certificate are skipped; an unreadable directory is
     * ConfigurationFailed.
     */
    [[nodiscard]] static Result<CertificateDirectory, BeaconFailure> LoadFromDirectory(
        const std::filesystem::path& directory);

    [[nodiscard]] static Result<Certificate, BeaconFailure> LoadCertificateFile(
        const std::filesystem::path& file);

    /// Adds or replaces the entry for the certificate's common name.
    [[nodiscard]] Result<NodeId, BeaconFailure> Insert(const Certificate& certificate);

    [[nodiscard]] std::optional<DirectoryRecord> Lookup(const NodeId& node_id) const override;

    [[nodiscard]] size_t Size() const;

    CertificateDirectory(CertificateDirectory&& other) noexcept;
    CertificateDirectory& operator=(CertificateDirectory&&) = delete;
    CertificateDirectory(const CertificateDirectory&) = delete;
    CertificateDirectory& operator=(const CertificateDirectory&) = delete;
    ~CertificateDirectory() override = default;
private:
    mutable std::shared_mutex mutex_;
    std::map<NodeId, DirectoryRecord> records_;
};

}

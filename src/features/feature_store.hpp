#ifndef XPECONOMY_FEATURES_FEATURE_STORE_HPP
#define XPECONOMY_FEATURES_FEATURE_STORE_HPP

#include <string>
#include <vector>
#include <cstdint>
#include "config/economy_params.hpp"
#include "core/errors.hpp"
#include "core/types.hpp"
#include "ledger/transaction_manager.hpp"

/**
 * @file feature_store.hpp
 * @brief Premium reading features bought with spendable XP.
 *
 * Ownership is the set of feature_purchases rows for an account; a row is never
 * updated or removed, so a purchase is permanent and a second purchase of the
 * same feature is AlreadyOwned with no charge.
 *
 * Bundles charge one transaction for all their members. When some members are
 * already owned the charge is min(bundle price, sum of the unowned prices) and
 * only the unowned members are granted.
 */

namespace xpeconomy {
namespace features {

struct FeatureListing
{
    core::FeatureCatalogEntry entry;
    bool owned = false;
    bool affordable = false;
    bool prerequisitesMet = false;
};

struct ChunkingProgression
{
    std::vector<std::string> ownedLevels;
    int64_t maxChunkSize = 1;        ///< largest chunk size usable (1 = word by word)
    std::string nextLevel;           ///< empty when every level is owned
    int64_t nextLevelPrice = 0;
};

struct BundleRecommendation
{
    core::FeatureBundle bundle;
    std::vector<std::string> unowned;
    int64_t charge = 0;              ///< what buying it now would cost
    int64_t savings = 0;             ///< against buying the unowned members one by one
};

/// Features worth buying next with the XP the account holds right now.
struct FeatureRecommendations
{
    std::vector<core::FeatureCatalogEntry> affordable;   ///< cheapest first, ties by id
    std::string nextChunkingLevel;   ///< empty when every level is owned
    int64_t nextChunkingPrice = 0;
    bool nextChunkingAffordable = false;
    std::vector<BundleRecommendation> bundles;
};

struct CategorySummary
{
    std::string category;
    int64_t total = 0;
    int64_t owned = 0;
    int64_t xpSpent = 0;
};

struct FeatureSummary
{
    std::string accountId;
    int64_t totalFeatures = 0;
    std::vector<std::string> owned;
    int64_t xpSpent = 0;
    std::vector<CategorySummary> categories;    ///< in catalog order
};

class FeatureStore
{
public:
    FeatureStore(ledger::TransactionManager &transactions, const config::EconomyParams &params);

    static std::vector<core::FeatureCatalogEntry> DefaultCatalog();
    static std::vector<core::FeatureBundle> DefaultBundles();

    /// Writes the default catalog and bundles when the catalog table is empty.
    core::Status SeedDefaultCatalog();

    core::Result<core::FeaturePurchase> PurchaseFeature(const std::string &accountId,
                                                        const std::string &featureId,
                                                        ledger::Deadline deadline = ledger::NoDeadline());

    core::Result<core::BundlePurchaseResult> PurchaseBundle(const std::string &accountId,
                                                            const std::string &bundleId,
                                                            ledger::Deadline deadline = ledger::NoDeadline());

    core::Result<bool> OwnsFeature(const std::string &accountId, const std::string &featureId);
    core::Result<std::vector<FeatureListing>> ListFeatures(const std::string &accountId);

    /// NotFound when no catalog entry carries the category.
    core::Result<std::vector<FeatureListing>> ListFeaturesByCategory(const std::string &accountId,
                                                                     const std::string &category);

    /**
     * Affordable features are unowned, have their prerequisites met and cost no more
     * than the spendable balance; at most @p limit of them, cheapest first. A bundle
     * is recommended when at least two members are unowned and its charge is
     * affordable. A frozen account gets no affordable features or bundles.
     */
    core::Result<FeatureRecommendations> GetFeatureRecommendations(const std::string &accountId,
                                                                   size_t limit = 3);

    /// Owned features and the XP paid for them, per catalog category.
    core::Result<FeatureSummary> GetFeatureSummary(const std::string &accountId);
    core::Result<std::vector<core::FeatureBundle>> ListBundles();
    core::Result<ChunkingProgression> GetChunkingProgression(const std::string &accountId);

private:
    ledger::TransactionManager &m_transactions;
    const config::EconomyParams &m_params;
};

} // namespace features
} // namespace xpeconomy

#endif // XPECONOMY_FEATURES_FEATURE_STORE_HPP

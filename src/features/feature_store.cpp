#include "features/feature_store.hpp"
#include "util/logger.hpp"

#include <algorithm>
#include <map>
#include <set>

namespace xpeconomy {
namespace features {

using core::ErrorCode;
using core::FeatureBundle;
using core::FeatureCatalogEntry;
using core::Result;

namespace {

const std::vector<std::string> kChunkingLevels = {
    "2word_chunking", "3word_chunking", "4word_chunking", "5word_chunking"
};

FeatureCatalogEntry makeEntry(const std::string &id, const std::string &name, int64_t price,
                              const std::string &category, std::vector<std::string> prerequisites = {})
{
    FeatureCatalogEntry e;
    e.featureId = id;
    e.name = name;
    e.price = price;
    e.category = category;
    e.prerequisites = std::move(prerequisites);
    return e;
}

std::string joinIds(const std::vector<std::string> &ids)
{
    std::string out;
    for (const auto &id : ids) {
        if (!out.empty()) {
            out += ", ";
        }
        out += id;
    }
    return out;
}

} // namespace

FeatureStore::FeatureStore(ledger::TransactionManager &transactions, const config::EconomyParams &params)
    : m_transactions(transactions), m_params(params)
{
}

std::vector<FeatureCatalogEntry> FeatureStore::DefaultCatalog()
{
    return {
        makeEntry("font_opensans",       "OpenSans Font",            25, "fonts"),
        makeEntry("font_opendyslexic",   "OpenDyslexic Font",        50, "fonts"),
        makeEntry("font_roboto",         "Roboto Font",              25, "fonts"),
        makeEntry("font_merriweather",   "Merriweather Font",        30, "fonts"),
        makeEntry("font_playfair",       "Playfair Display Font",    35, "fonts"),
        makeEntry("2word_chunking",      "2-Word Chunking",          75, "chunking"),
        makeEntry("3word_chunking",      "3-Word Chunking",         100, "chunking",
                  {"2word_chunking"}),
        makeEntry("4word_chunking",      "4-Word Chunking",         125, "chunking",
                  {"2word_chunking", "3word_chunking"}),
        makeEntry("5word_chunking",      "5-Word Chunking",         150, "chunking",
                  {"2word_chunking", "3word_chunking", "4word_chunking"}),
        makeEntry("smart_connector_grouping", "Smart Connector Grouping", 75, "smart_features"),
        makeEntry("smart_symbol_handling",    "Smart Symbol Handling",    50, "smart_features"),
        makeEntry("theme_dark",          "Dark Reading Theme",       40, "themes"),
        makeEntry("theme_sepia",         "Sepia Premium Theme",      60, "themes"),
    };
}

std::vector<FeatureBundle> FeatureStore::DefaultBundles()
{
    FeatureBundle fonts;
    fonts.bundleId = "font_starter_pack";
    fonts.name     = "Font Starter Pack";
    fonts.price    = 40;
    fonts.members  = {"font_opensans", "font_roboto"};

    FeatureBundle chunking;
    chunking.bundleId = "chunking_progression";
    chunking.name     = "Chunking Progression Pack";
    chunking.price    = 150;
    chunking.members  = {"2word_chunking", "3word_chunking"};

    FeatureBundle smart;
    smart.bundleId = "smart_reading_combo";
    smart.name     = "Smart Reading Combo";
    smart.price    = 100;
    smart.members  = {"smart_connector_grouping", "smart_symbol_handling"};

    return {fonts, chunking, smart};
}

core::Status FeatureStore::SeedDefaultCatalog()
{
    storage::LedgerStore &store = m_transactions.Store();
    try {
        if (!store.LoadCatalog().empty()) {
            return core::OkStatus();
        }
        store.RunInTransaction([&]() {
            for (const auto &entry : DefaultCatalog()) {
                store.UpsertCatalogEntry(entry);
            }
            for (const auto &bundle : DefaultBundles()) {
                store.UpsertBundle(bundle);
            }
            return true;
        });
    }
    catch (const core::StoreError &ex) {
        util::logger::error(std::string("[FeatureStore] Seeding the catalog failed: ") + ex.what());
        return core::Status::Fail(ErrorCode::StorageError, ex.what());
    }
    util::logger::info("[FeatureStore] Seeded default catalog with " + std::to_string(DefaultCatalog().size())
                       + " features and " + std::to_string(DefaultBundles().size()) + " bundles");
    return core::OkStatus();
}

Result<core::FeaturePurchase> FeatureStore::PurchaseFeature(const std::string &accountId,
                                                            const std::string &featureId,
                                                            ledger::Deadline deadline)
{
    using R = Result<core::FeaturePurchase>;

    auto result = m_transactions.Execute<core::FeaturePurchase>(accountId, [&](ledger::LedgerSession &session) {
        storage::LedgerStore &store = session.Store();

        auto entry = store.LoadCatalogEntry(featureId);
        if (!entry) {
            return R::Fail(ErrorCode::NotFound, "Unknown feature '" + featureId + "'");
        }
        if (store.OwnsFeature(accountId, featureId)) {
            return R::Fail(ErrorCode::AlreadyOwned, accountId + " already owns " + entry->name);
        }

        std::vector<std::string> missing;
        for (const auto &prereq : entry->prerequisites) {
            if (!store.OwnsFeature(accountId, prereq)) {
                missing.push_back(prereq);
            }
        }
        if (!missing.empty()) {
            return R::Fail(ErrorCode::PrerequisiteMissing,
                           entry->name + " requires: " + joinIds(missing));
        }

        core::TransactionRefs refs;
        refs.featureRef = featureId;
        auto spent = session.Spend(entry->price, core::sources::FeaturePurchase, "Purchased " + entry->name, refs);
        if (!spent) {
            return R::From(spent);
        }

        core::FeaturePurchase purchase;
        purchase.accountId     = accountId;
        purchase.featureId     = featureId;
        purchase.costPaid      = entry->price;
        purchase.transactionId = spent.value().id;
        purchase.createdAt     = session.Now();
        if (!store.InsertPurchase(purchase)) {
            return R::Fail(ErrorCode::AlreadyOwned, accountId + " already owns " + entry->name);
        }
        return R::Ok(purchase);
    }, deadline);

    if (result) {
        util::logger::info("[FeatureStore] " + accountId + " bought " + featureId + " for "
                           + std::to_string(result.value().costPaid) + " XP");
    }
    else {
        util::logger::info("[FeatureStore] Purchase of " + featureId + " by " + accountId + " rejected: "
                           + result.message());
    }
    return result;
}

Result<core::BundlePurchaseResult> FeatureStore::PurchaseBundle(const std::string &accountId,
                                                                const std::string &bundleId,
                                                                ledger::Deadline deadline)
{
    using R = Result<core::BundlePurchaseResult>;

    auto result = m_transactions.Execute<core::BundlePurchaseResult>(accountId, [&](ledger::LedgerSession &session) {
        storage::LedgerStore &store = session.Store();

        auto bundle = store.LoadBundle(bundleId);
        if (!bundle) {
            return R::Fail(ErrorCode::NotFound, "Unknown bundle '" + bundleId + "'");
        }

        std::vector<FeatureCatalogEntry> unowned;
        for (const auto &member : bundle->members) {
            auto entry = store.LoadCatalogEntry(member);
            if (!entry) {
                return R::Fail(ErrorCode::NotFound, "Bundle " + bundleId + " lists unknown feature '" + member + "'");
            }
            if (!store.OwnsFeature(accountId, member)) {
                unowned.push_back(*entry);
            }
        }
        if (unowned.empty()) {
            return R::Fail(ErrorCode::AlreadyOwned, accountId + " already owns every feature in " + bundle->name);
        }

        std::set<std::string> members(bundle->members.begin(), bundle->members.end());
        std::vector<std::string> missing;
        int64_t sumUnowned = 0;
        for (const auto &entry : unowned) {
            sumUnowned += entry.price;
            for (const auto &prereq : entry.prerequisites) {
                if (members.count(prereq) == 0 && !store.OwnsFeature(accountId, prereq)) {
                    missing.push_back(prereq);
                }
            }
        }
        if (!missing.empty()) {
            return R::Fail(ErrorCode::PrerequisiteMissing, bundle->name + " requires: " + joinIds(missing));
        }

        int64_t charge = std::min(bundle->price, sumUnowned);
        core::TransactionRefs refs;
        refs.featureRef = bundleId;
        auto spent = session.Spend(charge, core::sources::BundlePurchase, "Purchased bundle " + bundle->name, refs);
        if (!spent) {
            return R::From(spent);
        }

        core::BundlePurchaseResult out;
        out.bundleId = bundleId;
        out.charged = charge;
        out.transaction = spent.value();

        // Split the charge across granted members in proportion to list price.
        int64_t allocated = 0;
        for (size_t i = 0; i < unowned.size(); ++i) {
            core::FeaturePurchase purchase;
            purchase.accountId     = accountId;
            purchase.featureId     = unowned[i].featureId;
            purchase.costPaid      = (i + 1 == unowned.size())
                                         ? charge - allocated
                                         : (sumUnowned > 0 ? charge * unowned[i].price / sumUnowned : 0);
            purchase.transactionId = spent.value().id;
            purchase.bundleId      = bundleId;
            purchase.createdAt     = session.Now();
            allocated += purchase.costPaid;
            if (!store.InsertPurchase(purchase)) {
                return R::Fail(ErrorCode::AlreadyOwned, accountId + " already owns " + unowned[i].name);
            }
            out.granted.push_back(purchase);
        }
        return R::Ok(out);
    }, deadline);

    if (result) {
        util::logger::info("[FeatureStore] " + accountId + " bought bundle " + bundleId + " for "
                           + std::to_string(result.value().charged) + " XP ("
                           + std::to_string(result.value().granted.size()) + " features)");
    }
    else {
        util::logger::info("[FeatureStore] Bundle " + bundleId + " for " + accountId + " rejected: "
                           + result.message());
    }
    return result;
}

Result<bool> FeatureStore::OwnsFeature(const std::string &accountId, const std::string &featureId)
{
    try {
        return Result<bool>::Ok(m_transactions.Store().OwnsFeature(accountId, featureId));
    }
    catch (const core::StoreError &ex) {
        util::logger::error(std::string("[FeatureStore] OwnsFeature failed: ") + ex.what());
        return Result<bool>::Fail(ErrorCode::StorageError, ex.what());
    }
}

Result<std::vector<FeatureListing>> FeatureStore::ListFeatures(const std::string &accountId)
{
    using R = Result<std::vector<FeatureListing>>;
    auto account = m_transactions.GetAccount(accountId);
    if (!account) {
        return R::From(account);
    }

    try {
        const core::Account &a = account.value();
        std::set<std::string> owned(a.ownedFeatures.begin(), a.ownedFeatures.end());
        std::vector<FeatureListing> listings;
        for (const auto &entry : m_transactions.Store().LoadCatalog()) {
            FeatureListing listing;
            listing.entry = entry;
            listing.owned = owned.count(entry.featureId) > 0;
            listing.prerequisitesMet = std::all_of(entry.prerequisites.begin(), entry.prerequisites.end(),
                [&](const std::string &p) { return owned.count(p) > 0; });
            listing.affordable = !listing.owned && !a.spendingFrozen && a.spendableXp >= entry.price;
            listings.push_back(listing);
        }
        return R::Ok(listings);
    }
    catch (const core::StoreError &ex) {
        util::logger::error(std::string("[FeatureStore] ListFeatures failed: ") + ex.what());
        return R::Fail(ErrorCode::StorageError, ex.what());
    }
}

Result<std::vector<FeatureListing>> FeatureStore::ListFeaturesByCategory(const std::string &accountId,
                                                                        const std::string &category)
{
    using R = Result<std::vector<FeatureListing>>;
    auto listings = ListFeatures(accountId);
    if (!listings) {
        return listings;
    }
    std::vector<FeatureListing> matching;
    for (const auto &listing : listings.value()) {
        if (listing.entry.category == category) {
            matching.push_back(listing);
        }
    }
    if (matching.empty()) {
        return R::Fail(ErrorCode::NotFound, "Unknown feature category '" + category + "'");
    }
    return R::Ok(matching);
}

Result<FeatureRecommendations> FeatureStore::GetFeatureRecommendations(const std::string &accountId, size_t limit)
{
    using R = Result<FeatureRecommendations>;
    if (limit == 0) {
        return R::Fail(ErrorCode::ValidationError, "Recommendation limit must be positive");
    }
    auto account = m_transactions.GetAccount(accountId);
    if (!account) {
        return R::From(account);
    }
    auto chunking = GetChunkingProgression(accountId);
    if (!chunking) {
        return R::From(chunking);
    }

    const core::Account &a = account.value();
    const int64_t budget = a.spendingFrozen ? -1 : a.spendableXp;
    std::set<std::string> owned(a.ownedFeatures.begin(), a.ownedFeatures.end());

    FeatureRecommendations out;
    out.nextChunkingLevel = chunking.value().nextLevel;
    out.nextChunkingPrice = chunking.value().nextLevelPrice;
    out.nextChunkingAffordable = !out.nextChunkingLevel.empty() && budget >= out.nextChunkingPrice;

    try {
        storage::LedgerStore &store = m_transactions.Store();
        std::map<std::string, FeatureCatalogEntry> catalog;
        for (const auto &entry : store.LoadCatalog()) {
            catalog[entry.featureId] = entry;
            bool prerequisitesMet = std::all_of(entry.prerequisites.begin(), entry.prerequisites.end(),
                [&](const std::string &p) { return owned.count(p) > 0; });
            if (!owned.count(entry.featureId) && prerequisitesMet && budget >= entry.price) {
                out.affordable.push_back(entry);
            }
        }
        std::sort(out.affordable.begin(), out.affordable.end(),
            [](const FeatureCatalogEntry &l, const FeatureCatalogEntry &r) {
                return l.price != r.price ? l.price < r.price : l.featureId < r.featureId;
            });
        if (out.affordable.size() > limit) {
            out.affordable.resize(limit);
        }

        for (const auto &bundle : store.LoadBundles()) {
            BundleRecommendation rec;
            rec.bundle = bundle;
            std::set<std::string> members(bundle.members.begin(), bundle.members.end());
            int64_t sumUnowned = 0;
            bool purchasable = true;
            for (const auto &member : bundle.members) {
                auto entry = catalog.find(member);
                if (entry == catalog.end()) {
                    purchasable = false;
                    break;
                }
                if (owned.count(member)) {
                    continue;
                }
                rec.unowned.push_back(member);
                sumUnowned += entry->second.price;
                for (const auto &prereq : entry->second.prerequisites) {
                    if (!members.count(prereq) && !owned.count(prereq)) {
                        purchasable = false;
                    }
                }
            }
            rec.charge = std::min(bundle.price, sumUnowned);
            rec.savings = sumUnowned - rec.charge;
            if (purchasable && rec.unowned.size() >= 2 && budget >= rec.charge) {
                out.bundles.push_back(rec);
            }
        }
    }
    catch (const core::StoreError &ex) {
        util::logger::error(std::string("[FeatureStore] GetFeatureRecommendations failed: ") + ex.what());
        return R::Fail(ErrorCode::StorageError, ex.what());
    }
    return R::Ok(out);
}

Result<FeatureSummary> FeatureStore::GetFeatureSummary(const std::string &accountId)
{
    using R = Result<FeatureSummary>;
    auto account = m_transactions.GetAccount(accountId);
    if (!account) {
        return R::From(account);
    }

    try {
        storage::LedgerStore &store = m_transactions.Store();
        std::map<std::string, int64_t> paid;
        for (const auto &purchase : store.LoadPurchases(accountId)) {
            paid[purchase.featureId] += purchase.costPaid;
        }

        FeatureSummary summary;
        summary.accountId = accountId;
        std::map<std::string, size_t> slot;
        for (const auto &entry : store.LoadCatalog()) {
            auto it = slot.find(entry.category);
            if (it == slot.end()) {
                it = slot.emplace(entry.category, summary.categories.size()).first;
                summary.categories.push_back(CategorySummary());
                summary.categories.back().category = entry.category;
            }
            CategorySummary &category = summary.categories[it->second];
            ++category.total;
            ++summary.totalFeatures;

            auto bought = paid.find(entry.featureId);
            if (bought != paid.end()) {
                ++category.owned;
                category.xpSpent += bought->second;
                summary.xpSpent += bought->second;
                summary.owned.push_back(entry.featureId);
            }
        }
        return R::Ok(summary);
    }
    catch (const core::StoreError &ex) {
        util::logger::error(std::string("[FeatureStore] GetFeatureSummary failed: ") + ex.what());
        return R::Fail(ErrorCode::StorageError, ex.what());
    }
}

Result<std::vector<FeatureBundle>> FeatureStore::ListBundles()
{
    try {
        return Result<std::vector<FeatureBundle>>::Ok(m_transactions.Store().LoadBundles());
    }
    catch (const core::StoreError &ex) {
        util::logger::error(std::string("[FeatureStore] ListBundles failed: ") + ex.what());
        return Result<std::vector<FeatureBundle>>::Fail(ErrorCode::StorageError, ex.what());
    }
}

Result<ChunkingProgression> FeatureStore::GetChunkingProgression(const std::string &accountId)
{
    auto account = m_transactions.GetAccount(accountId);
    if (!account) {
        return Result<ChunkingProgression>::From(account);
    }

    const auto &ownedIds = account.value().ownedFeatures;
    std::set<std::string> owned(ownedIds.begin(), ownedIds.end());

    ChunkingProgression progression;
    bool contiguous = true;
    for (size_t i = 0; i < kChunkingLevels.size(); ++i) {
        const std::string &level = kChunkingLevels[i];
        if (owned.count(level)) {
            progression.ownedLevels.push_back(level);
            if (contiguous) {
                progression.maxChunkSize = static_cast<int64_t>(i) + 2;
            }
            continue;
        }
        contiguous = false;
        if (progression.nextLevel.empty()) {
            progression.nextLevel = level;
        }
    }

    if (!progression.nextLevel.empty()) {
        try {
            auto entry = m_transactions.Store().LoadCatalogEntry(progression.nextLevel);
            if (entry) {
                progression.nextLevelPrice = entry->price;
            }
        }
        catch (const core::StoreError &ex) {
            util::logger::error(std::string("[FeatureStore] GetChunkingProgression failed: ") + ex.what());
            return Result<ChunkingProgression>::Fail(ErrorCode::StorageError, ex.what());
        }
    }
    return Result<ChunkingProgression>::Ok(progression);
}

} // namespace features
} // namespace xpeconomy

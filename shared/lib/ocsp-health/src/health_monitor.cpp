/**
 * @file health_monitor.cpp
 * @brief Monitoring cycle orchestration implementation
 */

#include "ocspdash/health/health_monitor.h"
#include "ocspdash/health/cert_ops.h"

#include <algorithm>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace ocspdash::health {

// --- JSON rendering ---

Json::Value CycleSummary::toJson() const {
    Json::Value json;
    json["started"] = formatIso8601(startedAt);
    json["durationMs"] = static_cast<Json::Int64>(duration.count());
    json["authorities"] = static_cast<Json::UInt64>(authorities);
    json["locations"] = static_cast<Json::UInt64>(locations);
    json["targets"] = static_cast<Json::UInt64>(targets);
    json["results"] = static_cast<Json::UInt64>(results);
    json["good"] = static_cast<Json::UInt64>(good);
    json["questionable"] = static_cast<Json::UInt64>(questionable);
    json["bad"] = static_cast<Json::UInt64>(bad);
    json["cancelled"] = static_cast<Json::UInt64>(cancelled);
    Json::Value degraded(Json::arrayValue);
    for (const auto& id : degradedAuthorities) {
        degraded.append(id);
    }
    json["degradedAuthorities"] = degraded;
    return json;
}

Json::Value ManifestEntry::toJson() const {
    Json::Value json;
    json["authority_name"] = authorityName;
    json["responder_url"] = responderUrl;
    json["subject_certificate"] = subjectBase64;
    json["issuer_certificate"] = issuerBase64;
    return json;
}

Json::Value HealthReport::toJson() const {
    Json::Value json;
    json["generated"] = formatIso8601(generatedAt);

    Json::Value locationsJson(Json::arrayValue);
    for (const auto& location : locations) {
        Json::Value l;
        l["id"] = location.id;
        l["name"] = location.name;
        locationsJson.append(l);
    }
    json["locations"] = locationsJson;

    Json::Value sectionsJson(Json::arrayValue);
    for (const auto& section : sections) {
        Json::Value s;
        s["authority"]["id"] = section.authority.id;
        s["authority"]["name"] = section.authority.name;
        s["authority"]["cardinality"] = static_cast<Json::Int64>(section.authority.cardinality);
        s["degraded"] = section.degraded;

        Json::Value rowsJson(Json::arrayValue);
        for (const auto& row : section.rows) {
            Json::Value r;
            r["url"] = row.responder.url;
            r["cardinality"] = static_cast<Json::Int64>(row.responder.cardinality);
            r["current"] = row.current;
            Json::Value results(Json::arrayValue);
            for (const auto& cell : row.cells) {
                results.append(cell.result ? cell.result->toJson() : Json::Value(Json::nullValue));
            }
            r["results"] = results;
            rowsJson.append(r);
        }
        s["rows"] = rowsJson;
        sectionsJson.append(s);
    }
    json["sections"] = sectionsJson;
    return json;
}

// --- HealthMonitor ---

HealthMonitor::HealthMonitor(ICertificateSource* source,
                             DiscoveryCache* cache,
                             LocationRegistry* registry,
                             ProbeDispatcher* dispatcher,
                             ResultStore* store,
                             const IClock* clock,
                             MonitorSettings settings)
    : source_(source), cache_(cache), registry_(registry), dispatcher_(dispatcher),
      store_(store), clock_(clock), settings_(settings)
{
    if (!cache_) throw std::invalid_argument("HealthMonitor: cache cannot be nullptr");
    if (!registry_) throw std::invalid_argument("HealthMonitor: registry cannot be nullptr");
    if (!dispatcher_) throw std::invalid_argument("HealthMonitor: dispatcher cannot be nullptr");
    if (!store_) throw std::invalid_argument("HealthMonitor: store cannot be nullptr");
    if (!clock_) throw std::invalid_argument("HealthMonitor: clock cannot be nullptr");
}

void HealthMonitor::registerAuthority(const Authority& authority) {
    if (authority.id.empty()) {
        throw std::invalid_argument("HealthMonitor: authority id cannot be empty");
    }
    std::lock_guard<std::mutex> lock(catalogMutex_);
    catalog_[authority.id] = authority;
    spdlog::info("[HealthMonitor] Registered authority {} ({})", authority.name, authority.id);
}

std::vector<Authority> HealthMonitor::rankedLocked() const {
    std::vector<Authority> ranked;
    ranked.reserve(catalog_.size());
    for (const auto& [id, authority] : catalog_) {
        ranked.push_back(authority);
    }
    std::stable_sort(ranked.begin(), ranked.end(), [](const Authority& a, const Authority& b) {
        return a.cardinality > b.cardinality;
    });
    if (settings_.topAuthorities > 0 && ranked.size() > static_cast<size_t>(settings_.topAuthorities)) {
        ranked.resize(static_cast<size_t>(settings_.topAuthorities));
    }
    return ranked;
}

std::vector<Authority> HealthMonitor::authorities() const {
    std::lock_guard<std::mutex> lock(catalogMutex_);
    return rankedLocked();
}

std::vector<Authority> HealthMonitor::refreshAuthorities() {
    const TimePoint now = clock_->now();
    bool stale;
    {
        std::lock_guard<std::mutex> lock(catalogMutex_);
        stale = !catalogRefreshedAt_ || now - *catalogRefreshedAt_ >= settings_.catalogTtl;
    }
    if (!source_ || settings_.topAuthorities <= 0 || !stale) {
        return authorities();
    }

    // The source is rate limited: readers must not wait on it
    std::vector<AuthorityRecord> records;
    try {
        records = source_->topAuthorities(settings_.topAuthorities);
    } catch (const std::exception& e) {
        std::lock_guard<std::mutex> lock(catalogMutex_);
        spdlog::warn("[HealthMonitor] Authority catalog refresh failed, keeping {} entries: {}",
                     catalog_.size(), e.what());
        return rankedLocked();
    }

    std::lock_guard<std::mutex> lock(catalogMutex_);
    for (const auto& record : records) {
        auto it = catalog_.find(record.keyId);
        if (it == catalog_.end()) {
            Authority authority;
            authority.id = record.keyId;
            authority.name = record.name.empty() ? record.keyId : record.name;
            authority.cardinality = record.cardinality;
            authority.rootCertificate = record.rootCertificate;
            catalog_.emplace(authority.id, std::move(authority));
        } else {
            // Only the population estimate changes after first sight
            it->second.cardinality = record.cardinality;
        }
    }
    catalogRefreshedAt_ = now;
    spdlog::info("[HealthMonitor] Authority catalog refreshed: {} records", records.size());
    return rankedLocked();
}

void HealthMonitor::nameFromSnapshot(const DiscoverySnapshot& snapshot) {
    std::lock_guard<std::mutex> lock(catalogMutex_);
    auto it = catalog_.find(snapshot.authorityId);
    if (it == catalog_.end()) return;

    Authority& authority = it->second;
    bool unnamed = authority.name.empty() || authority.name == authority.id;
    if (!unnamed && !authority.rootCertificate.empty()) return;

    // Chain issuers carrying the authority key identify the authority itself
    for (const auto& [chainId, chain] : snapshot.chains) {
        X509Ptr issuer = parseCertificate(chain.issuer);
        if (!issuer || getKeyIdentifier(issuer.get()) != authority.id) continue;

        if (unnamed) {
            std::string name = getSubjectOrganization(issuer.get());
            if (!name.empty()) {
                authority.name = name;
                spdlog::info("[HealthMonitor] Authority {} is {}", authority.id, name);
            }
        }
        if (authority.rootCertificate.empty() && isSelfSigned(issuer.get())) {
            authority.rootCertificate = chain.issuer;
        }
        return;
    }
}

CycleSummary HealthMonitor::runCycle(const CancellationToken& cancellation) {
    CycleSummary summary;
    summary.startedAt = clock_->now();
    const auto started = std::chrono::steady_clock::now();

    // Step 1: Authorities and locations
    std::vector<Authority> authorities = refreshAuthorities();
    std::vector<Location> locations = registry_->list();
    summary.authorities = authorities.size();
    summary.locations = locations.size();
    spdlog::info("[HealthMonitor] Cycle started: {} authorities, {} locations",
                 authorities.size(), locations.size());

    // Step 2: Discovery
    std::vector<ProbeTarget> targets;
    for (const auto& authority : authorities) {
        if (cancellation.isCancelled()) {
            spdlog::warn("[HealthMonitor] Cycle cancelled during discovery");
            break;
        }
        DiscoverySnapshot snapshot = cache_->getOrRefresh(authority);
        if (snapshot.degraded) {
            summary.degradedAuthorities.push_back(authority.id);
        }
        nameFromSnapshot(snapshot);

        auto authorityTargets = snapshot.targets(clock_->now());
        spdlog::debug("[HealthMonitor] {}: {} responders{}", authority.name, authorityTargets.size(),
                      snapshot.degraded ? " (degraded)" : "");
        targets.insert(targets.end(), authorityTargets.begin(), authorityTargets.end());
    }
    summary.targets = targets.size();

    // Step 3: Probing
    DispatchReport dispatch = dispatcher_->dispatch(locations, targets, cancellation);
    summary.results = dispatch.results.size();
    summary.good = dispatch.good;
    summary.questionable = dispatch.questionable;
    summary.bad = dispatch.bad;
    summary.cancelled = dispatch.cancelled;
    summary.duration = std::chrono::duration_cast<Millis>(std::chrono::steady_clock::now() - started);

    spdlog::info("[HealthMonitor] Cycle finished in {}ms: {} results (good={}, questionable={}, bad={}), "
                 "{} degraded authorities",
                 summary.duration.count(), summary.results, summary.good, summary.questionable,
                 summary.bad, summary.degradedAuthorities.size());
    return summary;
}

std::vector<ManifestEntry> HealthMonitor::manifest() const {
    std::vector<ManifestEntry> entries;
    const TimePoint now = clock_->now();

    for (const auto& authority : authorities()) {
        auto snapshot = cache_->peek(authority.id);
        if (!snapshot) continue;

        for (const auto& target : snapshot->targets(now)) {
            ManifestEntry entry;
            entry.authorityName = authority.name;
            entry.responderUrl = target.responder.url;
            entry.subjectBase64 = base64Encode(target.chain.subject);
            entry.issuerBase64 = base64Encode(target.chain.issuer);
            entries.push_back(std::move(entry));
        }
    }
    return entries;
}

std::string HealthMonitor::toJsonLines(const std::vector<ManifestEntry>& entries) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";

    std::string out;
    for (const auto& entry : entries) {
        out += Json::writeString(builder, entry.toJson());
        out += '\n';
    }
    return out;
}

HealthReport HealthMonitor::report(const std::vector<std::string>& authorityIds) const {
    HealthReport report;
    report.generatedAt = clock_->now();
    report.locations = registry_->list();

    std::vector<Authority> selected;
    if (authorityIds.empty()) {
        selected = authorities();
    } else {
        std::lock_guard<std::mutex> lock(catalogMutex_);
        for (const auto& id : authorityIds) {
            auto it = catalog_.find(id);
            if (it == catalog_.end()) {
                spdlog::debug("[HealthMonitor] report: unknown authority {}", id);
                continue;
            }
            selected.push_back(it->second);
        }
    }

    for (const auto& authority : selected) {
        AuthoritySection section;
        section.authority = authority;

        auto snapshot = cache_->peek(authority.id);
        if (snapshot) {
            section.degraded = snapshot->degraded;
            for (const auto& known : snapshot->responders) {
                StatusRow row;
                row.responder = known.responder;
                auto chain = snapshot->selectChain(known, report.generatedAt);
                row.current = chain && !chain->isExpiredAt(report.generatedAt);
                for (const auto& location : report.locations) {
                    row.cells.push_back({location.id, store_->latest(known.responder.id(), location.id)});
                }
                section.rows.push_back(std::move(row));
            }
            std::stable_sort(section.rows.begin(), section.rows.end(),
                             [](const StatusRow& a, const StatusRow& b) {
                                 if (a.responder.cardinality != b.responder.cardinality) {
                                     return a.responder.cardinality > b.responder.cardinality;
                                 }
                                 return a.responder.url < b.responder.url;
                             });
        }
        report.sections.push_back(std::move(section));
    }
    return report;
}

} // namespace ocspdash::health

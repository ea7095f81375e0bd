#include <dcarchive/archive/partition_index.h>
#include <dcarchive/archive/tar_packer.h>
#include <dcarchive/common/error.h>
#include <dcarchive/common/logging.h>
#include <dcarchive/sync/sync_planner.h>
#include <dcarchive/utils/json.h>

namespace dcarchive {

SyncPlanner::SyncPlanner(PartitionCatalog &catalog, SyncConfig config)
    : catalog_(catalog), config_(std::move(config)) {}

std::optional<Timestamp> SyncPlanner::scan_parts(
    const PartitionListing &listing) {
    std::optional<Timestamp> latest;
    json::JsonParser parser;

    for (const auto &part_name : listing.part_names) {
        auto data = catalog_.read_part(listing.key, part_name);
        if (!data) continue;

        std::vector<TarMember> members;
        try {
            members = read_tar(*data);
        } catch (const ArchiveError &e) {
            DCARCHIVE_LOG_WARN("Skipping unreadable Part %s of %s: %s",
                               part_name.c_str(),
                               listing.key.to_string().c_str(), e.what());
            continue;
        }

        for (const auto &member : members) {
            if (member.name.size() < 5 ||
                member.name.compare(member.name.size() - 5, 5, ".json") != 0) {
                continue;
            }
            auto doc = json::parse_json(parser, member.data.data(),
                                        member.data.size());
            if (!doc) continue;
            auto scraped = json::find_string_field(*doc, "scraped_at");
            if (!scraped) continue;
            auto ts = Timestamp::parse(*scraped);
            if (ts && (!latest || *ts > *latest)) {
                latest = ts;
            }
        }
    }
    return latest;
}

std::optional<Timestamp> SyncPlanner::find_boundary(
    const std::string &state_code) {
    std::optional<Timestamp> boundary;
    std::size_t partitions = 0;

    for (ArchiveType type : config_.archive_types) {
        for (const auto &listing : catalog_.list(type, state_code)) {
            std::optional<Timestamp> coverage;
            if (listing.has_index) {
                auto text = catalog_.read_index(listing.key);
                if (text) {
                    coverage =
                        PartitionIndex::from_json(listing.key, *text)
                            .updated_at();
                }
            }
            if (!coverage && config_.scan_parts_fallback &&
                type == ArchiveType::METADATA && !listing.part_names.empty()) {
                DCARCHIVE_LOG_DEBUG("No usable Index for %s, scanning %zu Parts",
                                    listing.key.to_string().c_str(),
                                    listing.part_names.size());
                coverage = scan_parts(listing);
            }
            if (!coverage) {
                DCARCHIVE_LOG_WARN("Coverage of %s is unknown, ignoring it",
                                   listing.key.to_string().c_str());
                continue;
            }
            ++partitions;
            if (!boundary || *coverage < *boundary) {
                boundary = coverage;
            }
        }
    }

    if (boundary) {
        DCARCHIVE_LOG_INFO("State %s: sync boundary %s over %zu partitions",
                           state_code.c_str(),
                           boundary->to_iso_string().c_str(), partitions);
    } else {
        DCARCHIVE_LOG_INFO("State %s: no archived partitions",
                           state_code.c_str());
    }
    return boundary;
}

Date SyncPlanner::window_start(const std::string &state_code,
                               const Date &today) {
    auto boundary = find_boundary(state_code);
    if (!boundary) {
        return config_.epoch_start ? *config_.epoch_start
                                   : Date(today.year, 1, 1);
    }
    return boundary->local_date().add_days(1);
}

std::optional<DateRange> SyncPlanner::compute_sync_window(
    const std::string &state_code, const Date &today,
    const std::optional<Date> &end) {
    return compute_sync_window(std::vector<std::string>{state_code}, today,
                               end);
}

std::optional<DateRange> SyncPlanner::compute_sync_window(
    const std::vector<std::string> &state_codes, const Date &today,
    const std::optional<Date> &end) {
    if (state_codes.empty()) {
        throw ArchiveError(ArchiveError::INVALID_ARGUMENT,
                           "No jurisdictions to plan a sync for");
    }

    std::optional<Date> start;
    for (const auto &state_code : state_codes) {
        Date state_start = window_start(state_code, today);
        if (!start || state_start < *start) {
            start = state_start;
        }
    }

    Date window_end = today;
    if (end && *end < window_end) {
        window_end = *end;
    }
    if (*start > window_end) {
        DCARCHIVE_LOG_INFO("Archive is current up to %s, nothing to sync",
                           window_end.to_string().c_str());
        return std::nullopt;
    }
    return DateRange{*start, window_end};
}

}  // namespace dcarchive

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include "core/BaselineSnapshot.hpp"
#include "detection/DetectionRegistry.hpp"
#include "detection/DetectorConfig.hpp"

namespace Sentinel
{
    namespace Persistence
    {
        /**
         * BaselineStore
         *
         * Reads and writes baseline snapshots as JSON:
         *
         *   {
         *     "baseline":   { "<metric>": { "mean": .., "std": .., "ewma": .., "count": .. } },
         *     "history":    { "<metric>": [ .. ] },
         *     "updated_at": "YYYY-MM-DDTHH:MM:SS",
         *     "metadata":   { "window_size": .., "threshold": .., "ewma_alpha": .. }
         *   }
         *
         * Failures are reported through the return value and the logger;
         * nothing here throws on bad files.
         */
        class BaselineStore
        {
        public:
            explicit BaselineStore(std::string path);

            /// std::nullopt if the file is missing or not a valid snapshot.
            std::optional<core::BaselineSnapshot> load() const;

            /// Write the snapshot, creating parent directories. False on failure.
            bool save(const core::BaselineSnapshot &snapshot,
                      const Detection::DetectorConfig &config) const;

            const std::string &path() const noexcept { return m_path; }

            /// Parse a JSON document; std::nullopt on malformed JSON or a non-object root.
            static std::optional<core::BaselineSnapshot> parse(std::string_view text);

            /// JSON text of the snapshot; indent < 0 gives compact output.
            static std::string serialize(const core::BaselineSnapshot &snapshot,
                                         const Detection::DetectorConfig &config,
                                         int indent = 2);

            /// Seed every metric's history into the registry. Returns the number of metrics seeded.
            static std::size_t apply(const core::BaselineSnapshot &snapshot,
                                     Detection::DetectionRegistry &registry);

        private:
            std::string m_path;
        };

    } // namespace Persistence
} // namespace Sentinel

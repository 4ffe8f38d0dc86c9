#pragma once

#include <string>
#include <boost/filesystem.hpp>
#include "Exanges/PaperSimulator/Ledger/ILedgerStore.hpp"

namespace PaperPerp::Infra::Exanges::PaperSimulator {
    /**
     * Directory layout per account:
     *   <root>/<account>/gen-<N>/{accounts,positions,trades,orders}.csv
     *   <root>/<account>/CURRENT     name of the committed generation
     *
     * save() writes a complete new generation and then renames a temporary
     * pointer file over CURRENT, so readers only ever see a whole snapshot.
     */
    class CsvLedgerStore : public ILedgerStore {
    public:
        explicit CsvLedgerStore(const std::string& root, int keep_generations = 2);

        std::optional<Ledger> load(const std::string& account) override;
        void save(const Ledger& ledger) override;

        // Generation directory CURRENT points at, empty when nothing was saved
        boost::filesystem::path current_generation(const std::string& account) const;

    private:
        boost::filesystem::path root_;
        int keep_generations_;

        boost::filesystem::path account_dir(const std::string& account) const;
        int current_generation_number(const std::string& account) const;
        void prune(const std::string& account, int current) const;
    };
}

/*
 * This code is licensed under the Fastbot license. You may obtain a copy of this license in the LICENSE.txt file in the root directory of this source tree.
 */
#ifndef PolicyStore_H_
#define PolicyStore_H_

#include <string>
#include <map>
#include <set>
#include <memory>
#include <mutex>
#include <thread>
#include <atomic>
#include <condition_variable>

namespace scoutbot {

    /**
     * @brief Learned value of one (screen state, action key) pair
     */
    struct PolicyEntry {
        double value = 0.0;
        int visits = 0;
        /// pending human feedback, in [-3, 3]
        double feedback = 0.0;
    };

    typedef std::map<std::string, PolicyEntry> PolicyEntryMap;

    /**
     * @brief Key-value store for the learned policy
     *
     * Keys are "screenHash|actionKey". The engine treats the store as an
     * eventually durable cache; the in-memory table of PolicyAgent is
     * authoritative during a run.
     */
    class PolicyPersistence {
    public:
        virtual bool get(const std::string &key, PolicyEntry &entry) const = 0;

        virtual PolicyEntry getOrDefault(const std::string &key) const = 0;

        virtual void upsert(const std::string &key, const PolicyEntry &entry) = 0;

        /// @return the visit count after the increment
        virtual int incrementVisitCount(const std::string &key) = 0;

        virtual PolicyEntryMap entries() const = 0;

        /// dangerous patterns are scoped to the target package they were seen on
        virtual void addDangerousPattern(const std::string &target, const std::string &pattern) = 0;

        virtual std::set<std::string> dangerousPatterns(const std::string &target) const = 0;

        virtual void setScreenVisits(const std::string &stateHash, int visits) = 0;

        virtual std::map<std::string, int> screenVisits() const = 0;

        virtual void recordBestStrategy(const std::string &target, const std::string &strategy) = 0;

        virtual bool getBestStrategy(const std::string &target, std::string &strategy) const = 0;

        /// write pending changes to durable storage, if any
        virtual bool flush() { return true; }

        virtual ~PolicyPersistence() = default;
    };

    typedef std::shared_ptr<PolicyPersistence> PolicyPersistencePtr;

    class MemoryPolicyStore : public PolicyPersistence {
    public:
        MemoryPolicyStore();

        bool get(const std::string &key, PolicyEntry &entry) const override;

        PolicyEntry getOrDefault(const std::string &key) const override;

        void upsert(const std::string &key, const PolicyEntry &entry) override;

        int incrementVisitCount(const std::string &key) override;

        PolicyEntryMap entries() const override;

        void addDangerousPattern(const std::string &target, const std::string &pattern) override;

        std::set<std::string> dangerousPatterns(const std::string &target) const override;

        void setScreenVisits(const std::string &stateHash, int visits) override;

        std::map<std::string, int> screenVisits() const override;

        void recordBestStrategy(const std::string &target, const std::string &strategy) override;

        bool getBestStrategy(const std::string &target, std::string &strategy) const override;

        /// bumped on every modification
        long revision() const { return this->_revision.load(); }

    protected:
        mutable std::mutex _storeLock;
        PolicyEntryMap _entries;
        /// target package -> dangerous action patterns
        std::map<std::string, std::set<std::string>> _dangerous;
        std::map<std::string, int> _screenVisits;
        std::map<std::string, std::string> _bestStrategies;
        std::atomic<long> _revision;
    };

    /**
     * @brief FlatBuffers backed policy file
     *
     * The file is written to "<path>.tmp" and renamed over the target, so a
     * crash during a save leaves the previous file intact. A background thread
     * saves every interval while there are unsaved changes.
     */
    class FilePolicyStore : public MemoryPolicyStore {
    public:
        static std::shared_ptr<FilePolicyStore> create(const std::string &modelFilePath);

        /// replace the content with the file; false if missing or corrupt
        bool load();

        bool save();

        bool flush() override;

        void startBackgroundSave(int intervalMs);

        void stopBackgroundSave();

        const std::string &getModelFilePath() const { return this->_modelFilePath; }

        ~FilePolicyStore() override;

    protected:
        explicit FilePolicyStore(std::string modelFilePath);

    private:
        void threadModelStorage(int intervalMs);

        std::string _modelFilePath;
        std::mutex _saveLock;
        long _savedRevision;

        std::thread _saveThread;
        std::mutex _threadLock;
        std::condition_variable _threadSignal;
        bool _stopRequested;
    };

    typedef std::shared_ptr<FilePolicyStore> FilePolicyStorePtr;

}

#endif //PolicyStore_H_

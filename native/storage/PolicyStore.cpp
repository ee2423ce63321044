/*
 * This code is licensed under the Fastbot license. You may obtain a copy of this license in the LICENSE.txt file in the root directory of this source tree.
 */
#ifndef PolicyStore_CPP_
#define PolicyStore_CPP_

#include "PolicyStore.h"
#include "PolicyModel_generated.h"
#include "../utils.hpp"
#include <flatbuffers/flatbuffers.h>
#include <fstream>
#include <vector>
#include <cstdio>
#include <chrono>
#include <utility>

namespace PolicyStorageConstants {
    constexpr std::size_t MaxModelFileSize = 100 * 1024 * 1024;
    constexpr int ModelFileVersion = 2;
}  // namespace PolicyStorageConstants

namespace scoutbot {

    MemoryPolicyStore::MemoryPolicyStore()
            : _revision(0) {}

    bool MemoryPolicyStore::get(const std::string &key, PolicyEntry &entry) const {
        std::lock_guard<std::mutex> guard(this->_storeLock);
        auto iter = this->_entries.find(key);
        if (iter == this->_entries.end())
            return false;
        entry = iter->second;
        return true;
    }

    PolicyEntry MemoryPolicyStore::getOrDefault(const std::string &key) const {
        PolicyEntry entry;
        this->get(key, entry);
        return entry;
    }

    void MemoryPolicyStore::upsert(const std::string &key, const PolicyEntry &entry) {
        std::lock_guard<std::mutex> guard(this->_storeLock);
        this->_entries[key] = entry;
        this->_revision++;
    }

    int MemoryPolicyStore::incrementVisitCount(const std::string &key) {
        std::lock_guard<std::mutex> guard(this->_storeLock);
        int visits = ++this->_entries[key].visits;
        this->_revision++;
        return visits;
    }

    PolicyEntryMap MemoryPolicyStore::entries() const {
        std::lock_guard<std::mutex> guard(this->_storeLock);
        return this->_entries;
    }

    void MemoryPolicyStore::addDangerousPattern(const std::string &target, const std::string &pattern) {
        std::lock_guard<std::mutex> guard(this->_storeLock);
        if (this->_dangerous[target].insert(pattern).second)
            this->_revision++;
    }

    std::set<std::string> MemoryPolicyStore::dangerousPatterns(const std::string &target) const {
        std::lock_guard<std::mutex> guard(this->_storeLock);
        auto iter = this->_dangerous.find(target);
        if (iter == this->_dangerous.end())
            return std::set<std::string>();
        return iter->second;
    }

    void MemoryPolicyStore::setScreenVisits(const std::string &stateHash, int visits) {
        std::lock_guard<std::mutex> guard(this->_storeLock);
        this->_screenVisits[stateHash] = visits;
        this->_revision++;
    }

    std::map<std::string, int> MemoryPolicyStore::screenVisits() const {
        std::lock_guard<std::mutex> guard(this->_storeLock);
        return this->_screenVisits;
    }

    void MemoryPolicyStore::recordBestStrategy(const std::string &target, const std::string &strategy) {
        std::lock_guard<std::mutex> guard(this->_storeLock);
        this->_bestStrategies[target] = strategy;
        this->_revision++;
    }

    bool MemoryPolicyStore::getBestStrategy(const std::string &target, std::string &strategy) const {
        std::lock_guard<std::mutex> guard(this->_storeLock);
        auto iter = this->_bestStrategies.find(target);
        if (iter == this->_bestStrategies.end())
            return false;
        strategy = iter->second;
        return true;
    }

    std::shared_ptr<FilePolicyStore> FilePolicyStore::create(const std::string &modelFilePath) {
        return std::shared_ptr<FilePolicyStore>(new FilePolicyStore(modelFilePath));
    }

    FilePolicyStore::FilePolicyStore(std::string modelFilePath)
            : _modelFilePath(std::move(modelFilePath)), _savedRevision(0), _stopRequested(false) {
    }

    FilePolicyStore::~FilePolicyStore() {
        this->stopBackgroundSave();
    }

    /**
     * @brief Load the policy file written by save()
     *
     * A missing file is normal on the first run. Files that fail the
     * FlatBuffers verifier are rejected and leave the store untouched.
     */
    bool FilePolicyStore::load() {
        BLOG("begin load policy model: %s", this->_modelFilePath.c_str());
        std::ifstream modelFile(this->_modelFilePath, std::ios::binary | std::ios::in);
        if (!modelFile.is_open()) {
            BLOG("policy model %s not found, start from scratch", this->_modelFilePath.c_str());
            return false;
        }

        modelFile.seekg(0, std::ios::end);
        std::streamoff fileSize = modelFile.tellg();
        modelFile.seekg(0, std::ios::beg);
        if (fileSize <= 0 || static_cast<std::size_t>(fileSize) > PolicyStorageConstants::MaxModelFileSize) {
            BLOGE("Invalid policy model file size: %lld", static_cast<long long>(fileSize));
            return false;
        }

        std::vector<uint8_t> modelFileData(static_cast<std::size_t>(fileSize));
        modelFile.read(reinterpret_cast<char *>(modelFileData.data()), fileSize);
        if (modelFile.gcount() != fileSize) {
            BLOGE("Failed to read complete policy model: read %lld bytes, expected %lld bytes",
                  static_cast<long long>(modelFile.gcount()), static_cast<long long>(fileSize));
            return false;
        }

        flatbuffers::Verifier verifier(modelFileData.data(), modelFileData.size());
        if (!fb::VerifyPolicyModelBuffer(verifier)) {
            BLOGE("policy model %s is corrupt", this->_modelFilePath.c_str());
            return false;
        }

        auto policyModel = fb::GetPolicyModel(modelFileData.data());
        PolicyEntryMap loadedEntries;
        if (policyModel->records()) {
            for (flatbuffers::uoffset_t i = 0; i < policyModel->records()->size(); i++) {
                auto record = policyModel->records()->Get(i);
                if (!record->key())
                    continue;
                PolicyEntry entry;
                entry.value = record->value();
                entry.visits = record->visits();
                entry.feedback = record->feedback();
                loadedEntries.emplace(record->key()->str(), entry);
            }
        }
        std::map<std::string, std::set<std::string>> loadedDangerous;
        size_t dangerousCount = 0;
        if (policyModel->dangerous()) {
            for (flatbuffers::uoffset_t i = 0; i < policyModel->dangerous()->size(); i++) {
                auto record = policyModel->dangerous()->Get(i);
                if (record->target() && record->pattern()
                    && loadedDangerous[record->target()->str()].insert(record->pattern()->str()).second)
                    dangerousCount++;
            }
        }
        std::map<std::string, std::string> loadedStrategies;
        if (policyModel->strategies()) {
            for (flatbuffers::uoffset_t i = 0; i < policyModel->strategies()->size(); i++) {
                auto record = policyModel->strategies()->Get(i);
                if (record->target() && record->strategy())
                    loadedStrategies[record->target()->str()] = record->strategy()->str();
            }
        }
        std::map<std::string, int> loadedVisits;
        if (policyModel->screen_visits()) {
            for (flatbuffers::uoffset_t i = 0; i < policyModel->screen_visits()->size(); i++) {
                auto record = policyModel->screen_visits()->Get(i);
                if (record->state())
                    loadedVisits[record->state()->str()] = record->visits();
            }
        }

        {
            std::lock_guard<std::mutex> guard(this->_storeLock);
            this->_entries.swap(loadedEntries);
            this->_dangerous.swap(loadedDangerous);
            this->_bestStrategies.swap(loadedStrategies);
            this->_screenVisits.swap(loadedVisits);
            this->_savedRevision = this->_revision.load();
        }
        BLOG("loaded policy model: %zu entries, %zu dangerous patterns, version %d",
             this->_entries.size(), dangerousCount, policyModel->version());
        return true;
    }

    bool FilePolicyStore::save() {
        std::lock_guard<std::mutex> saveGuard(this->_saveLock);
        if (this->_modelFilePath.empty()) {
            BLOGE("%s", "Cannot save policy model: output file path is empty");
            return false;
        }

        flatbuffers::FlatBufferBuilder builder;
        long revision = 0;
        std::vector<flatbuffers::Offset<fb::PolicyRecord>> records;
        std::vector<flatbuffers::Offset<fb::DangerousRecord>> dangerous;
        std::vector<flatbuffers::Offset<fb::StrategyRecord>> strategies;
        std::vector<flatbuffers::Offset<fb::ScreenVisitRecord>> visits;
        {
            std::lock_guard<std::mutex> guard(this->_storeLock);
            revision = this->_revision.load();
            for (const auto &entry: this->_entries) {
                records.push_back(fb::CreatePolicyRecord(builder, builder.CreateString(entry.first),
                                                         entry.second.value, entry.second.visits,
                                                         entry.second.feedback));
            }
            for (const auto &target: this->_dangerous) {
                for (const auto &pattern: target.second) {
                    dangerous.push_back(fb::CreateDangerousRecord(builder, builder.CreateString(target.first),
                                                                  builder.CreateString(pattern)));
                }
            }
            for (const auto &strategy: this->_bestStrategies) {
                strategies.push_back(fb::CreateStrategyRecord(builder, builder.CreateString(strategy.first),
                                                              builder.CreateString(strategy.second)));
            }
            for (const auto &screen: this->_screenVisits) {
                visits.push_back(fb::CreateScreenVisitRecord(builder, builder.CreateString(screen.first),
                                                             screen.second));
            }
        }

        auto policyModel = fb::CreatePolicyModel(builder, PolicyStorageConstants::ModelFileVersion,
                                                 builder.CreateVector(records),
                                                 builder.CreateVector(dangerous),
                                                 builder.CreateVector(strategies),
                                                 builder.CreateVector(visits));
        fb::FinishPolicyModelBuffer(builder, policyModel);

        std::string tempFilePath = this->_modelFilePath + ".tmp";
        std::ofstream outputFile(tempFilePath, std::ios::binary);
        if (!outputFile.is_open()) {
            BLOGE("Failed to open temporary file for writing: %s", tempFilePath.c_str());
            return false;
        }
        outputFile.write(reinterpret_cast<const char *>(builder.GetBufferPointer()),
                         static_cast<std::streamsize>(builder.GetSize()));
        outputFile.close();
        if (outputFile.fail()) {
            BLOGE("Failed to write policy model to temporary file: %s", tempFilePath.c_str());
            std::remove(tempFilePath.c_str());
            return false;
        }
        if (std::rename(tempFilePath.c_str(), this->_modelFilePath.c_str()) != 0) {
            BLOGE("Failed to rename temporary file to final file: %s -> %s",
                  tempFilePath.c_str(), this->_modelFilePath.c_str());
            std::remove(tempFilePath.c_str());
            return false;
        }
        this->_savedRevision = revision;
        BLOG("policy model saved to %s (%zu entries)", this->_modelFilePath.c_str(), records.size());
        return true;
    }

    bool FilePolicyStore::flush() {
        return this->save();
    }

    void FilePolicyStore::startBackgroundSave(int intervalMs) {
        std::lock_guard<std::mutex> guard(this->_threadLock);
        if (this->_saveThread.joinable())
            return;
        this->_stopRequested = false;
        this->_saveThread = std::thread(&FilePolicyStore::threadModelStorage, this, intervalMs);
    }

    void FilePolicyStore::stopBackgroundSave() {
        {
            std::lock_guard<std::mutex> guard(this->_threadLock);
            this->_stopRequested = true;
        }
        this->_threadSignal.notify_all();
        if (this->_saveThread.joinable())
            this->_saveThread.join();
    }

    /**
     * @brief Background save loop
     *
     * Wakes every intervalMs and saves when the store changed since the last
     * save. stopBackgroundSave() wakes it immediately; the destructor joins it.
     */
    void FilePolicyStore::threadModelStorage(int intervalMs) {
        const auto interval = std::chrono::milliseconds(intervalMs);
        while (true) {
            {
                std::unique_lock<std::mutex> lock(this->_threadLock);
                if (this->_threadSignal.wait_for(lock, interval, [this] { return this->_stopRequested; }))
                    break;
            }
            bool dirty = false;
            {
                std::lock_guard<std::mutex> saveGuard(this->_saveLock);
                dirty = this->_revision.load() != this->_savedRevision;
            }
            if (dirty && !this->save()) {
                BLOGE("background save of %s failed", this->_modelFilePath.c_str());
            }
        }
    }

}

#endif //PolicyStore_CPP_

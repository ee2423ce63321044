/*
 * This code is licensed under the Fastbot license. You may obtain a copy of this license in the LICENSE.txt file in the root directory of this source tree.
 */
#include "../../model/Explorer.h"
#include "../../model/Clock.h"
#include "../../storage/PolicyStore.h"
#include "../../events/Preference.h"
#include "../sim/SimulatedApp.h"
#include "../../utils.hpp"
#include <cstdio>
#include <cstring>
#include <string>

namespace {

    /// logs what the engine reports
    class LogStatusSink : public scoutbot::StatusSink {
    public:
        void onTransition(scoutbot::LifecycleState from, scoutbot::LifecycleState to,
                          scoutbot::LifecycleEvent event) override {
            BLOG("lifecycle %s -> %s on %s", scoutbot::lifecycleStateName(from), scoutbot::lifecycleStateName(to),
                 scoutbot::lifecycleEventName(event));
        }

        void onProgress(const scoutbot::ProgressReport &report) override {
            BDLOG("progress: %d screens, %d elements, %zu queued, coverage %.3f", report.screensExplored,
                  report.elementsExplored, report.frontierSize, report.coverage);
        }

        void onIssue(const scoutbot::ExplorationIssue &issue) override {
            BLOG("issue %s on %s: %s", scoutbot::issueTypeName(issue.type), issue.screenId.c_str(),
                 issue.message.c_str());
        }

        void onHumanHelpRequested(const std::string &screenId, const std::string &message) override {
            BLOG("help requested on %s: %s", screenId.c_str(), message.c_str());
        }
    };

    void printUsage(const char *program) {
        std::fprintf(stderr, "usage: %s <app.json> [config.json] [--model path]\n", program);
    }

}

int main(int argc, char *argv[]) {
    std::string appPath;
    std::string configPath;
    std::string modelPath;
    for (int i = 1; i < argc; i++) {
        if (0 == std::strcmp(argv[i], "--model")) {
            if (i + 1 >= argc) {
                printUsage(argv[0]);
                return 2;
            }
            modelPath = argv[++i];
        } else if (appPath.empty()) {
            appPath = argv[i];
        } else if (configPath.empty()) {
            configPath = argv[i];
        } else {
            printUsage(argv[0]);
            return 2;
        }
    }
    if (appPath.empty()) {
        printUsage(argv[0]);
        return 2;
    }

    BLOG("scoutbot native build %s", SCOUTBOT_VERSION);
    scoutbot::SimulatedAppPtr app = scoutbot::SimulatedApp::fromFile(appPath);
    if (!app) {
        BLOGE("cannot load simulated app %s", appPath.c_str());
        return 1;
    }

    scoutbot::Preference preference;
    if (!configPath.empty() && !preference.loadConfigFile(configPath)) {
        BLOGE("cannot load config %s", configPath.c_str());
        return 1;
    }
    if (modelPath.empty())
        modelPath = preference.getConfig().policyModelPath;

    scoutbot::PolicyPersistencePtr store;
    scoutbot::FilePolicyStorePtr fileStore;
    if (!modelPath.empty()) {
        fileStore = scoutbot::FilePolicyStore::create(modelPath);
        if (!fileStore->load())
            BLOG("no usable policy model at %s, starting fresh", modelPath.c_str());
        fileStore->startBackgroundSave(scoutbot::ExplorerConstants::PolicySaveIntervalMs);
        store = fileStore;
    } else {
        store = std::make_shared<scoutbot::MemoryPolicyStore>();
    }

    // the simulated device runs on virtual time
    auto clock = std::make_shared<scoutbot::ManualClock>(0);
    scoutbot::ExplorerPtr explorer = scoutbot::Explorer::create(app, app, clock, store,
                                                                std::make_shared<LogStatusSink>());
    if (!explorer)
        return 1;
    scoutbot::ExplorationResult result = explorer->explore(app->getPackageName(), preference.getConfig());

    if (fileStore) {
        fileStore->stopBackgroundSave();
        if (!fileStore->save())
            BLOGE("saving policy model to %s failed", modelPath.c_str());
    }
    std::printf("%s\n", result.toJson().c_str());
    return result.status == scoutbot::RunStatus::Error ? 1 : 0;
}

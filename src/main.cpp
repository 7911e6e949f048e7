#include "AutoConfig.h"
#include "LeaderboardExport.h"
#include "StrataExceptions.h"
#include "TabularData.h"
#include "TerminalUI.h"
#include "TrainingEngine.h"

#include <iostream>

int main(int argc, char* argv[]) {
    AutoConfig config;
    try {
        config = AutoConfig::fromArgs(argc, argv);
    } catch (const Strata::StrataException& e) {
        std::cerr << "[Strata][Error] " << e.what() << "\n";
        return 1;
    }

    try {
        if (config.verbose) std::cout << "[Strata] Loading " << config.datasetPath << "\n";
        const TabularData train = TabularData::fromCsv(config.datasetPath, config.delimiter);

        TrainingEngine engine(config);
        const Predictor predictor = engine.fit(train);

        TerminalUI::printSummary(predictor.summary());
        TerminalUI::printResources(predictor.summary().resources, predictor.summary().budgetSeconds);
        TerminalUI::printLeaderboard(predictor.leaderboard(), predictor.ensembleWeights());
        TerminalUI::printEnsemble(predictor.registry(), predictor.ensembleWeights(), predictor.summary());
        TerminalUI::printFailures(predictor.summary().failures);

        if (!config.leaderboardOut.empty()) {
            const std::string written = LeaderboardExport::write(
                LeaderboardExport::leaderboardTable(predictor.leaderboard(), predictor.ensembleWeights()),
                config.leaderboardOut,
                config.exportFormat);
            std::cout << "[Strata] Leaderboard written to " << written << "\n";
        }
        if (!config.oofOut.empty()) {
            const std::string written = LeaderboardExport::write(
                LeaderboardExport::oofTable(predictor), config.oofOut, config.exportFormat);
            std::cout << "[Strata] OOF predictions written to " << written << "\n";
        }

        if (!config.testPath.empty()) {
            const TabularData test = TabularData::fromCsv(config.testPath, config.delimiter);
            const ExportTable predictions = LeaderboardExport::predictionTable(predictor, test);
            if (!config.predictionsOut.empty()) {
                LeaderboardExport::writeCsv(predictions, config.predictionsOut);
                std::cout << "[Strata] " << predictions.rowCount() << " prediction(s) written to " << config.predictionsOut << "\n";
            } else {
                const auto& labels = predictions.columns.front().strings;
                for (const auto& label : labels) std::cout << label << "\n";
            }
        }
    } catch (const Strata::StrataException& e) {
        std::cerr << "[Strata][Error] " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[Strata][Error] Unexpected failure: " << e.what() << "\n";
        return 1;
    }
    return 0;
}

#include "BatchProcessor.h"
#include <algorithm>

namespace standardize_core {

namespace {

class StandardizeJob : public juce::ThreadPoolJob {
  public:
    StandardizeJob(const PipelineConfig& config,
                   const BatchProcessor::CollaboratorFactory& factory,
                   BatchItemResult& item)
        : juce::ThreadPoolJob("standardize " + item.input.getFileName()), config_(config), factory_(factory),
          item_(item) {}

    JobStatus runJob() override {
        StandardizePipeline pipeline(config_, factory_());
        auto outcome = pipeline.process(PathSource{item_.input}, OutputTarget{PathTarget{item_.output}});
        item_.result = outcome.result;

        if (item_.result.failed())
            juce::Logger::writeToLog("Failed " + item_.input.getFullPathName() + ": " + item_.result.describe());

        return jobHasFinished;
    }

  private:
    const PipelineConfig& config_;
    const BatchProcessor::CollaboratorFactory& factory_;
    BatchItemResult& item_;
};

class AnalyzeJob : public juce::ThreadPoolJob {
  public:
    AnalyzeJob(const BatchProcessor::CollaboratorFactory& factory, BitrateReportEntry& entry)
        : juce::ThreadPoolJob("analyze " + entry.file.getFileName()), factory_(factory), entry_(entry) {}

    JobStatus runJob() override {
        auto collaborators = factory_();
        if (collaborators.bitrateAnalyzer == nullptr) {
            entry_.result = PipelineResult::fail(ErrorKind::ConfigurationError, "no bitrate analyzer");
            return jobHasFinished;
        }

        entry_.result = collaborators.bitrateAnalyzer->analyze(SourceMedia::fromFile(entry_.file), entry_.stats);
        return jobHasFinished;
    }

  private:
    const BatchProcessor::CollaboratorFactory& factory_;
    BitrateReportEntry& entry_;
};

/** Run every job on a fresh pool and block until all have finished. */
template <typename Job>
void runAll(std::vector<std::unique_ptr<Job>>& jobs, int numWorkers) {
    juce::ThreadPool pool(juce::jmax(1, numWorkers));

    for (auto& job : jobs)
        pool.addJob(job.get(), false);

    for (auto& job : jobs)
        pool.waitForJobToFinish(job.get(), -1);
}

} // namespace

BatchProcessor::BatchProcessor(PipelineConfig config, int numWorkers, CollaboratorFactory factory)
    : config_(std::move(config)), numWorkers_(juce::jmax(1, numWorkers)), factory_(std::move(factory)) {}

juce::Array<juce::File> BatchProcessor::findInputs(const juce::File& dir, const juce::String& wildcard) {
    auto files = dir.findChildFiles(juce::File::findFiles, false, wildcard);
    std::sort(files.begin(), files.end(), [](const juce::File& a, const juce::File& b) {
        return a.getFullPathName() < b.getFullPathName();
    });
    return files;
}

std::vector<BatchItemResult> BatchProcessor::processFiles(
    const std::vector<std::pair<juce::File, juce::File>>& pairs) {
    std::vector<BatchItemResult> items(pairs.size());
    for (size_t i = 0; i < pairs.size(); ++i) {
        items[i].input = pairs[i].first;
        items[i].output = pairs[i].second;
    }

    if (auto result = config_.validate(); result.failed()) {
        for (auto& item : items)
            item.result = result;
        return items;
    }

    std::vector<std::unique_ptr<StandardizeJob>> jobs;
    jobs.reserve(items.size());
    for (auto& item : items)
        jobs.push_back(std::make_unique<StandardizeJob>(config_, factory_, item));

    runAll(jobs, numWorkers_);
    return items;
}

std::vector<BatchItemResult> BatchProcessor::processDirectory(const juce::File& inputDir,
                                                              const juce::File& outputDir,
                                                              const juce::String& wildcard) {
    if (!inputDir.isDirectory()) {
        juce::Logger::writeToLog("Not a directory: " + inputDir.getFullPathName());
        return {};
    }

    if (auto created = outputDir.createDirectory(); created.failed()) {
        juce::Logger::writeToLog("Cannot create " + outputDir.getFullPathName() + ": " + created.getErrorMessage());
        return {};
    }

    std::vector<std::pair<juce::File, juce::File>> pairs;
    for (const auto& input : findInputs(inputDir, wildcard))
        pairs.emplace_back(input, outputDir.getChildFile(input.getFileName()));

    auto items = processFiles(pairs);

    int failures = 0;
    for (const auto& item : items)
        failures += item.result.failed() ? 1 : 0;

    juce::Logger::writeToLog("Standardized " + juce::String(static_cast<int>(items.size()) - failures) + " of "
                             + juce::String(static_cast<int>(items.size())) + " files from "
                             + inputDir.getFullPathName());
    return items;
}

std::vector<BitrateReportEntry> BatchProcessor::analyzeDirectory(const juce::File& dir, const juce::String& wildcard) {
    std::vector<BitrateReportEntry> entries;
    if (!dir.isDirectory())
        return entries;

    for (const auto& file : findInputs(dir, wildcard)) {
        BitrateReportEntry entry;
        entry.file = file;
        entries.push_back(std::move(entry));
    }

    std::vector<std::unique_ptr<AnalyzeJob>> jobs;
    jobs.reserve(entries.size());
    for (auto& entry : entries)
        jobs.push_back(std::make_unique<AnalyzeJob>(factory_, entry));

    runAll(jobs, numWorkers_);

    for (const auto& entry : entries) {
        if (entry.result.wasOk()) {
            DBG(entry.file.getFileName() + ": avg " + juce::String(entry.stats.averageBitrateKbps, 2) + " kbps, min "
                + juce::String(entry.stats.minBitrateKbps, 2) + " kbps, max "
                + juce::String(entry.stats.maxBitrateKbps, 2) + " kbps");
        }
    }
    return entries;
}

} // namespace standardize_core

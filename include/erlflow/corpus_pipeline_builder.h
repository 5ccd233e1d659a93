#pragma once

#include <erlflow/component_registry.h>
#include <erlflow/interfaces.h>
#include <erlflow/logging.h>

#include <memory>
#include <string>

namespace erlflow {

class DefaultCorpusPipeline;

struct PipelineComponents {
  std::unique_ptr<SourceLocator> locator;
  std::unique_ptr<SyntaxParser> parser;
  std::unique_ptr<ClauseGrouper> grouper;
  std::unique_ptr<FlowAnalyzer> analyzer;
  std::unique_ptr<DocumentationProvider> documentation;
  std::unique_ptr<RecordAssembler> assembler;
  std::unique_ptr<RecordSink> sink;
  std::shared_ptr<Logger> logger;
};

class CorpusPipelineBuilder {
public:
  explicit CorpusPipelineBuilder(
      const ComponentRegistry &registry = GlobalComponentRegistry());

  CorpusPipelineBuilder &WithLocator(std::unique_ptr<SourceLocator> locator);
  CorpusPipelineBuilder &WithParser(std::unique_ptr<SyntaxParser> parser);
  CorpusPipelineBuilder &WithGrouper(std::unique_ptr<ClauseGrouper> grouper);
  CorpusPipelineBuilder &
  WithFlowAnalyzer(std::unique_ptr<FlowAnalyzer> analyzer);
  CorpusPipelineBuilder &WithDocumentationProvider(
      std::unique_ptr<DocumentationProvider> documentation);
  CorpusPipelineBuilder &
  WithAssembler(std::unique_ptr<RecordAssembler> assembler);
  CorpusPipelineBuilder &WithSink(std::unique_ptr<RecordSink> sink);
  CorpusPipelineBuilder &WithLogger(std::shared_ptr<Logger> logger);
  CorpusPipelineBuilder &WithDocumentationProviderName(std::string name);
  CorpusPipelineBuilder &WithSinkName(std::string name);
  CorpusPipelineBuilder &WithOutputPath(std::string path);

  // Throws std::invalid_argument when no sink was supplied and no output
  // path is known.
  DefaultCorpusPipeline Build();

private:
  const ComponentRegistry *registry_;
  struct ComponentSelections {
    std::string documentation;
    std::string sink;
    std::string output_path;
  } selections_;
  PipelineComponents components_;
};

} // namespace erlflow

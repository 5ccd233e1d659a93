#pragma once

#include <erlflow/corpus_pipeline_builder.h>

#include <memory>

namespace erlflow {

// Fans files out over a bounded pool of worker threads and writes records
// from the calling thread in discovery order. The sink is touched by that
// thread only. A sink failure, or the first isolated error under fail_fast,
// stops dispatch; files already in flight finish before Run returns.
class DefaultCorpusPipeline : public CorpusPipeline {
public:
  explicit DefaultCorpusPipeline(PipelineComponents components);

  RunSummary Run(const CorpusConfig &config) override;

private:
  std::unique_ptr<SourceLocator> locator_;
  std::unique_ptr<SyntaxParser> parser_;
  std::unique_ptr<ClauseGrouper> grouper_;
  std::unique_ptr<FlowAnalyzer> analyzer_;
  std::unique_ptr<DocumentationProvider> documentation_;
  std::unique_ptr<RecordAssembler> assembler_;
  std::unique_ptr<RecordSink> sink_;
  std::shared_ptr<Logger> logger_;
};

} // namespace erlflow

#include <erlflow/corpus_pipeline_builder.h>

#include <erlflow/contiguous_clause_grouper.h>
#include <erlflow/default_corpus_pipeline.h>
#include <erlflow/erlang_parser.h>
#include <erlflow/erlang_source_locator.h>
#include <erlflow/graph_code_record_assembler.h>
#include <erlflow/variable_flow_analyzer.h>

#include <stdexcept>
#include <utility>

namespace {

template <typename Implementation, typename Interface>
std::unique_ptr<Interface>
EnsureComponent(std::unique_ptr<Interface> component) {
  if (component) {
    return component;
  }
  return std::make_unique<Implementation>();
}

} // namespace

namespace erlflow {

CorpusPipelineBuilder::CorpusPipelineBuilder(const ComponentRegistry &registry)
    : registry_(&registry) {
  selections_.documentation = registry_->DefaultDocumentationProviderName();
  selections_.sink = registry_->DefaultSinkName();
}

CorpusPipelineBuilder &
CorpusPipelineBuilder::WithLocator(std::unique_ptr<SourceLocator> locator) {
  components_.locator = std::move(locator);
  return *this;
}

CorpusPipelineBuilder &
CorpusPipelineBuilder::WithParser(std::unique_ptr<SyntaxParser> parser) {
  components_.parser = std::move(parser);
  return *this;
}

CorpusPipelineBuilder &
CorpusPipelineBuilder::WithGrouper(std::unique_ptr<ClauseGrouper> grouper) {
  components_.grouper = std::move(grouper);
  return *this;
}

CorpusPipelineBuilder &
CorpusPipelineBuilder::WithFlowAnalyzer(std::unique_ptr<FlowAnalyzer> analyzer) {
  components_.analyzer = std::move(analyzer);
  return *this;
}

CorpusPipelineBuilder &CorpusPipelineBuilder::WithDocumentationProvider(
    std::unique_ptr<DocumentationProvider> documentation) {
  components_.documentation = std::move(documentation);
  return *this;
}

CorpusPipelineBuilder &CorpusPipelineBuilder::WithAssembler(
    std::unique_ptr<RecordAssembler> assembler) {
  components_.assembler = std::move(assembler);
  return *this;
}

CorpusPipelineBuilder &
CorpusPipelineBuilder::WithSink(std::unique_ptr<RecordSink> sink) {
  components_.sink = std::move(sink);
  return *this;
}

CorpusPipelineBuilder &
CorpusPipelineBuilder::WithLogger(std::shared_ptr<Logger> logger) {
  components_.logger = std::move(logger);
  return *this;
}

CorpusPipelineBuilder &
CorpusPipelineBuilder::WithDocumentationProviderName(std::string name) {
  selections_.documentation = std::move(name);
  return *this;
}

CorpusPipelineBuilder &CorpusPipelineBuilder::WithSinkName(std::string name) {
  selections_.sink = std::move(name);
  return *this;
}

CorpusPipelineBuilder &CorpusPipelineBuilder::WithOutputPath(std::string path) {
  selections_.output_path = std::move(path);
  return *this;
}

DefaultCorpusPipeline CorpusPipelineBuilder::Build() {
  components_.logger = EnsureLogger(std::move(components_.logger));
  components_.locator =
      components_.locator
          ? std::move(components_.locator)
          : std::make_unique<ErlangSourceLocator>(components_.logger);
  components_.parser =
      EnsureComponent<ErlangParser>(std::move(components_.parser));
  components_.grouper =
      EnsureComponent<ContiguousClauseGrouper>(std::move(components_.grouper));
  components_.analyzer =
      EnsureComponent<VariableFlowAnalyzer>(std::move(components_.analyzer));
  components_.assembler = EnsureComponent<GraphCodeRecordAssembler>(
      std::move(components_.assembler));
  components_.documentation =
      components_.documentation
          ? std::move(components_.documentation)
          : registry_->CreateDocumentationProvider(selections_.documentation);
  if (!components_.sink) {
    if (selections_.output_path.empty()) {
      throw std::invalid_argument(
          "An output path is required to create the record emitter");
    }
    components_.sink =
        registry_->CreateSink(selections_.sink, selections_.output_path);
  }
  return DefaultCorpusPipeline(std::move(components_));
}

} // namespace erlflow

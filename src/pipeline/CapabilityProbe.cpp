#include "CapabilityProbe.h"
#include "PipelineError.h"

CapabilityProbe::CapabilityProbe(ToolExecutor* toolExecutor)
    : toolExecutor(toolExecutor)
{
}

void CapabilityProbe::setLogCallback(std::function<void(const juce::String&)> callback)
{
    logCallback = callback;
}

const juce::StringArray& CapabilityProbe::converterNames()
{
    static const juce::StringArray names { "soffice", "libreoffice" };
    return names;
}

PipelineTypes::Capabilities CapabilityProbe::probe()
{
    PipelineTypes::Capabilities capabilities;

    capabilities.ffmpeg = toolExecutor->findTool("ffmpeg");
    capabilities.ffprobe = toolExecutor->findTool("ffprobe");
    capabilities.rasterizer = toolExecutor->findTool("pdftoppm");
    capabilities.textExtractor = toolExecutor->findTool("pdftotext");
    capabilities.pageCounter = toolExecutor->findTool("pdfinfo");

    for (const auto& name : converterNames())
    {
        capabilities.converter = toolExecutor->findTool(name);
        if (capabilities.hasConverter())
        {
            capabilities.converterName = name;
            break;
        }
    }

    if (logCallback)
    {
        auto describe = [](const juce::File& f) { return f == juce::File() ? juce::String("not found") : f.getFullPathName(); };

        logCallback("Tool capabilities:");
        logCallback("  ffmpeg:    " + describe(capabilities.ffmpeg));
        logCallback("  ffprobe:   " + describe(capabilities.ffprobe));
        logCallback("  pdftoppm:  " + describe(capabilities.rasterizer));
        logCallback("  pdftotext: " + describe(capabilities.textExtractor));
        logCallback("  pdfinfo:   " + describe(capabilities.pageCounter));
        logCallback("  converter: " + describe(capabilities.converter));
    }

    return capabilities;
}

PipelineTypes::RasterStrategy CapabilityProbe::selectStrategy(const PipelineTypes::Capabilities& capabilities,
                                                              PipelineTypes::DocumentKind kind,
                                                              bool allowCompositionFallback)
{
    using Kind = PipelineError::Kind;

    if (!capabilities.hasEncoder())
        throw PipelineError(Kind::MissingDependency, "ffmpeg and ffprobe are required to render scenes");

    switch (kind)
    {
        case PipelineTypes::DocumentKind::Paginated:
            if (!capabilities.hasRasterizer())
                throw PipelineError(Kind::MissingDependency, "pdftoppm is required to rasterize PDF documents");
            return PipelineTypes::RasterStrategy::DirectRasterize;

        case PipelineTypes::DocumentKind::SlideDeck:
            if (capabilities.hasConverter() && capabilities.hasRasterizer())
                return PipelineTypes::RasterStrategy::ConvertThenRasterize;

            if (allowCompositionFallback)
                return PipelineTypes::RasterStrategy::ComposeInProcess;

            if (!capabilities.hasConverter())
                throw PipelineError(Kind::MissingDependency,
                                    "LibreOffice (soffice) is required to convert slide decks; "
                                    "enable the fallback renderer to compose slides without it");

            throw PipelineError(Kind::MissingDependency, "pdftoppm is required to rasterize converted slide decks");

        case PipelineTypes::DocumentKind::Unknown:
            break;
    }

    throw PipelineError(Kind::PageExtraction, "Unsupported input document type");
}

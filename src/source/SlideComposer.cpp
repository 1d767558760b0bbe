#include "SlideComposer.h"

SlideComposer::SlideComposer(int width, int height)
    : width(width), height(height)
{
}

juce::Image SlideComposer::composeSlide(const juce::String& text) const
{
    juce::Image image(juce::Image::RGB, width, height, true);
    juce::Graphics g(image);

    g.fillAll(juce::Colours::white);

    if (text.trim().isNotEmpty())
    {
        const float fontHeight = (float) height / 18.0f;
        const auto textArea = image.getBounds().reduced(width / 10, height / 10);

        g.setColour(juce::Colours::black);
        g.setFont(juce::Font(fontHeight));
        g.drawFittedText(text.trim(), textArea, juce::Justification::centred,
                         juce::jmax(1, (int) ((float) textArea.getHeight() / fontHeight)), 0.8f);
    }

    return image;
}

bool SlideComposer::writeSlide(const juce::String& text, const juce::File& destination) const
{
    // FileOutputStream appends to an existing file
    if (destination.existsAsFile() && !destination.deleteFile())
        return false;

    juce::FileOutputStream stream(destination);
    if (!stream.openedOk())
        return false;

    juce::PNGImageFormat png;
    if (!png.writeImageToStream(composeSlide(text), stream))
        return false;

    stream.flush();
    return stream.getStatus().wasOk();
}

#pragma once
#include <juce_core/juce_core.h>
#include <juce_graphics/juce_graphics.h>

/**
 * Draws slides in-process when no deck converter is available.
 *
 * This is the degraded rasterization strategy: each slide becomes its text,
 * centred on a plain white frame. Nothing of the original slide layout
 * survives; a configured background is applied later, when the scene is
 * encoded.
 */
class SlideComposer
{
public:
    SlideComposer(int width, int height);

    juce::Image composeSlide(const juce::String& text) const;

    /** Composes a slide and writes it as PNG. */
    bool writeSlide(const juce::String& text, const juce::File& destination) const;

    int getWidth() const  { return width; }
    int getHeight() const { return height; }

private:
    int width;
    int height;
};

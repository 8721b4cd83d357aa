/*******************************************************************************
 The block below describes the properties of this module, and is read by
 the Projucer to automatically generate project code that uses it.
 For details about the syntax and how to create or use a module, see the
 JUCE Module Format.md file.


 BEGIN_JUCE_MODULE_DECLARATION

  ID:                 standardize_core
  vendor:             tbd
  version:            1.0.0
  name:               Standardize Core
  description:        Trims, pads, compresses and loudness-normalizes recorded audio clips.
  website:            tbd
  license:            proprietary/commercial
  minimumCppStandard: 17

  dependencies:       juce_core, juce_data_structures, juce_audio_basics, juce_audio_formats, juce_dsp
  linuxLibs:          ebur128 avformat avcodec avutil

 END_JUCE_MODULE_DECLARATION

*******************************************************************************/

#pragma once
#define STANDARDIZE_CORE_H_INCLUDED

#include <juce_audio_formats/juce_audio_formats.h>
#include <juce_data_structures/juce_data_structures.h>
#include <juce_dsp/juce_dsp.h>

#include "Source/primitives/Decibels.h"
#include "Source/model/PipelineResult.h"
#include "Source/model/AudioClip.h"
#include "Source/model/BitrateStats.h"
#include "Source/model/MediaSource.h"
#include "Source/model/PipelineConfig.h"
#include "Source/services/SilenceBoundaryScanner.h"
#include "Source/services/AudioCodec.h"
#include "Source/services/JuceAudioCodec.h"
#include "Source/services/LoudnessMeter.h"
#include "Source/services/DynamicRangeCompressor.h"
#include "Source/services/BitrateAnalyzer.h"
#include "Source/clip_pipeline/ClipProcessingStage.h"
#include "Source/clip_pipeline/ClipPipeline.h"
#include "Source/clip_pipeline/PeakNormalizeStage.h"
#include "Source/clip_pipeline/TrimStage.h"
#include "Source/clip_pipeline/PadStage.h"
#include "Source/clip_pipeline/DynamicsStage.h"
#include "Source/clip_pipeline/LoudnessStage.h"
#include "Source/clip_pipeline/BitrateMatchStage.h"
#include "Source/engine/StandardizePipeline.h"
#include "Source/engine/BatchProcessor.h"

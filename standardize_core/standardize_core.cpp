#ifdef STANDARDIZE_CORE_H_INCLUDED
/* When you add this cpp file to your project, you mustn't include it in a file where you've
   already included any other headers - just put it inside a file on its own, possibly with your config
   flags preceding it, but don't include anything else. That also includes avoiding any automatic prefix
   header files that the compiler may be using.
*/
#error "Incorrect use of JUCE cpp file"
#endif

#include "standardize_core.h"
#include "Source/model/AudioClip.cpp"
#include "Source/model/MediaSource.cpp"
#include "Source/model/PipelineConfig.cpp"
#include "Source/services/SilenceBoundaryScanner.cpp"
#include "Source/services/JuceAudioCodec.cpp"
#include "Source/services/LoudnessMeter.cpp"
#include "Source/services/DynamicRangeCompressor.cpp"
#include "Source/services/BitrateAnalyzer.cpp"
#include "Source/clip_pipeline/ClipPipeline.cpp"
#include "Source/clip_pipeline/PeakNormalizeStage.cpp"
#include "Source/clip_pipeline/TrimStage.cpp"
#include "Source/clip_pipeline/PadStage.cpp"
#include "Source/clip_pipeline/LoudnessStage.cpp"
#include "Source/clip_pipeline/BitrateMatchStage.cpp"
#include "Source/engine/StandardizePipeline.cpp"
#include "Source/engine/BatchProcessor.cpp"

// Repository: Triptych-ingest
// Component: FFmpeg Concat Merger Implementation
// Copyright (c) 2026 Triptych

#include "triptych/merge/FFmpegConcatMerger.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/dict.h>
#include <libavutil/error.h>
#include <libavutil/mathematics.h>
}

#include "triptych/util/Logger.hpp"

namespace triptych::merge {

using triptych::util::Logger;

namespace {

// FFmpeg interrupt callback: return non-zero to abort blocking I/O.
int InterruptCallback(void* opaque) {
  auto* context = static_cast<const MergeContext*>(opaque);
  return context->ShouldAbort() ? 1 : 0;
}

std::string AvError(int ret) {
  char errbuf[AV_ERROR_MAX_STRING_SIZE];
  av_strerror(ret, errbuf, sizeof(errbuf));
  return errbuf;
}

struct InputCloser {
  void operator()(AVFormatContext* ctx) const { avformat_close_input(&ctx); }
};
using InputPtr = std::unique_ptr<AVFormatContext, InputCloser>;

struct OutputCloser {
  void operator()(AVFormatContext* ctx) const {
    if (ctx->pb && !(ctx->oformat->flags & AVFMT_NOFILE)) avio_closep(&ctx->pb);
    avformat_free_context(ctx);
  }
};
using OutputPtr = std::unique_ptr<AVFormatContext, OutputCloser>;

struct PacketFree {
  void operator()(AVPacket* pkt) const { av_packet_free(&pkt); }
};
using PacketPtr = std::unique_ptr<AVPacket, PacketFree>;

struct OpenedSource {
  InputPtr ctx;
  int video_index = -1;
  int audio_index = -1;
  int64_t duration_ms = 0;
};

bool SameVideo(const AVCodecParameters* a, const AVCodecParameters* b) {
  return a->codec_id == b->codec_id && a->width == b->width && a->height == b->height;
}

}  // namespace

FFmpegConcatMerger::FFmpegConcatMerger(std::string output_dir)
    : output_dir_(std::move(output_dir)) {
  if (mkdir(output_dir_.c_str(), 0755) != 0 && errno != EEXIST) {
    throw std::runtime_error("FFmpegConcatMerger: cannot create directory " + output_dir_);
  }
  av_log_set_level(AV_LOG_ERROR);
}

std::string FFmpegConcatMerger::OutputPathFor(const std::string& group_id) const {
  return output_dir_ + "/" + group_id + ".mp4";
}

MergeOutcome FFmpegConcatMerger::Run(const MergeJob& job, MergeContext& context) {
  if (job.sources.empty()) {
    return MergeOutcome::Failed(kSourceOpenFailedCode, "no sources");
  }

  // ---------------------------------------------------------------------------
  // Open and probe every source
  // ---------------------------------------------------------------------------
  std::vector<OpenedSource> inputs;
  inputs.reserve(job.sources.size());
  for (const auto& source : job.sources) {
    if (context.ShouldAbort()) return MergeOutcome::Cancelled();

    AVFormatContext* raw = avformat_alloc_context();
    if (!raw) return MergeOutcome::Failed(kSourceOpenFailedCode, "allocation failed");
    raw->interrupt_callback.callback = InterruptCallback;
    raw->interrupt_callback.opaque = &context;
    int ret = avformat_open_input(&raw, source.locator.c_str(), nullptr, nullptr);
    if (ret < 0) {
      // avformat_open_input frees the context on failure.
      if (context.ShouldAbort()) return MergeOutcome::Cancelled();
      std::ostringstream oss;
      oss << "statement " << source.statement_index << ": " << AvError(ret);
      return MergeOutcome::Failed(kSourceOpenFailedCode, oss.str());
    }
    OpenedSource opened;
    opened.ctx.reset(raw);

    ret = avformat_find_stream_info(opened.ctx.get(), nullptr);
    if (ret < 0) {
      if (context.ShouldAbort()) return MergeOutcome::Cancelled();
      std::ostringstream oss;
      oss << "statement " << source.statement_index << ": " << AvError(ret);
      return MergeOutcome::Failed(kSourceProbeFailedCode, oss.str());
    }
    opened.video_index =
        av_find_best_stream(opened.ctx.get(), AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
    if (opened.video_index < 0) {
      std::ostringstream oss;
      oss << "statement " << source.statement_index << ": no video stream";
      return MergeOutcome::Failed(kSourceProbeFailedCode, oss.str());
    }
    const int audio =
        av_find_best_stream(opened.ctx.get(), AVMEDIA_TYPE_AUDIO, -1, opened.video_index, nullptr, 0);
    opened.audio_index = audio >= 0 ? audio : -1;

    // Container duration, else the duration declared at upload.
    opened.duration_ms = opened.ctx->duration > 0
        ? av_rescale(opened.ctx->duration, 1000, AV_TIME_BASE)
        : source.declared_duration_ms;
    if (opened.duration_ms <= 0) {
      std::ostringstream oss;
      oss << "statement " << source.statement_index << ": unknown duration";
      return MergeOutcome::Failed(kSourceProbeFailedCode, oss.str());
    }
    inputs.push_back(std::move(opened));
  }

  const AVCodecParameters* ref_video =
      inputs.front().ctx->streams[inputs.front().video_index]->codecpar;
  const bool with_audio = inputs.front().audio_index >= 0;
  for (size_t i = 1; i < inputs.size(); ++i) {
    const AVCodecParameters* video = inputs[i].ctx->streams[inputs[i].video_index]->codecpar;
    if (!SameVideo(ref_video, video)) {
      return MergeOutcome::Failed(kIncompatibleSourcesCode,
                                  "video codec or frame size differs between statements");
    }
    if ((inputs[i].audio_index >= 0) != with_audio) {
      return MergeOutcome::Failed(kIncompatibleSourcesCode,
                                  "audio present in some statements only");
    }
    if (with_audio) {
      const AVCodecParameters* ref_audio =
          inputs.front().ctx->streams[inputs.front().audio_index]->codecpar;
      const AVCodecParameters* a = inputs[i].ctx->streams[inputs[i].audio_index]->codecpar;
      if (a->codec_id != ref_audio->codec_id) {
        return MergeOutcome::Failed(kIncompatibleSourcesCode,
                                    "audio codec differs between statements");
      }
    }
  }

  // ---------------------------------------------------------------------------
  // Open the output
  // ---------------------------------------------------------------------------
  const std::string final_path = OutputPathFor(job.group_id);
  const std::string temp_path = final_path + ".partial";
  OutputPtr out;
  {
    AVFormatContext* raw = nullptr;
    const int ret = avformat_alloc_output_context2(&raw, nullptr, "mp4", temp_path.c_str());
    if (ret < 0 || !raw) return MergeOutcome::Failed(kOutputOpenFailedCode, AvError(ret));
    out.reset(raw);
  }
  out->interrupt_callback.callback = InterruptCallback;
  out->interrupt_callback.opaque = &context;

  auto add_stream = [&out](const AVStream* in) -> AVStream* {
    AVStream* s = avformat_new_stream(out.get(), nullptr);
    if (!s) return nullptr;
    if (avcodec_parameters_copy(s->codecpar, in->codecpar) < 0) return nullptr;
    s->codecpar->codec_tag = 0;
    s->time_base = in->time_base;
    return s;
  };
  AVStream* out_video = add_stream(inputs.front().ctx->streams[inputs.front().video_index]);
  AVStream* out_audio = with_audio
      ? add_stream(inputs.front().ctx->streams[inputs.front().audio_index])
      : nullptr;
  if (!out_video || (with_audio && !out_audio)) {
    return MergeOutcome::Failed(kOutputOpenFailedCode, "cannot create output streams");
  }

  auto discard_partial = [&out, &temp_path]() {
    out.reset();
    (void)::unlink(temp_path.c_str());
  };

  if (!(out->oformat->flags & AVFMT_NOFILE)) {
    const int ret = avio_open2(&out->pb, temp_path.c_str(), AVIO_FLAG_WRITE,
                               &out->interrupt_callback, nullptr);
    if (ret < 0) {
      if (context.ShouldAbort()) return MergeOutcome::Cancelled();
      return MergeOutcome::Failed(kOutputOpenFailedCode, AvError(ret));
    }
  }
  AVDictionary* options = nullptr;
  av_dict_set(&options, "movflags", "+faststart", 0);
  int ret = avformat_write_header(out.get(), &options);
  av_dict_free(&options);
  if (ret < 0) {
    discard_partial();
    return MergeOutcome::Failed(kOutputOpenFailedCode, AvError(ret));
  }

  // ---------------------------------------------------------------------------
  // Copy packets, shifting each source by the cumulative offset
  // ---------------------------------------------------------------------------
  PacketPtr pkt(av_packet_alloc());
  if (!pkt) {
    discard_partial();
    return MergeOutcome::Failed(kMuxFailedCode, "allocation failed");
  }

  MergeResult result;
  int64_t offset_ms = 0;
  int64_t last_dts[2] = {AV_NOPTS_VALUE, AV_NOPTS_VALUE};
  const AVRational ms_base{1, 1000};

  for (size_t i = 0; i < inputs.size(); ++i) {
    OpenedSource& in = inputs[i];
    while (true) {
      if (context.ShouldAbort()) {
        discard_partial();
        return MergeOutcome::Cancelled();
      }
      ret = av_read_frame(in.ctx.get(), pkt.get());
      if (ret == AVERROR_EOF) break;
      if (ret < 0) {
        discard_partial();
        if (context.ShouldAbort()) return MergeOutcome::Cancelled();
        std::ostringstream oss;
        oss << "statement " << job.sources[i].statement_index << ": " << AvError(ret);
        return MergeOutcome::Failed(kMuxFailedCode, oss.str());
      }

      int slot = -1;
      AVStream* target = nullptr;
      if (pkt->stream_index == in.video_index) {
        slot = 0;
        target = out_video;
      } else if (with_audio && pkt->stream_index == in.audio_index) {
        slot = 1;
        target = out_audio;
      }
      if (!target) {
        av_packet_unref(pkt.get());
        continue;
      }

      const AVStream* source_stream = in.ctx->streams[pkt->stream_index];
      const int64_t start = source_stream->start_time != AV_NOPTS_VALUE
          ? source_stream->start_time : 0;
      if (pkt->pts != AV_NOPTS_VALUE) pkt->pts -= start;
      if (pkt->dts != AV_NOPTS_VALUE) pkt->dts -= start;
      av_packet_rescale_ts(pkt.get(), source_stream->time_base, target->time_base);
      const int64_t shift = av_rescale_q(offset_ms, ms_base, target->time_base);
      if (pkt->pts != AV_NOPTS_VALUE) pkt->pts += shift;
      if (pkt->dts != AV_NOPTS_VALUE) pkt->dts += shift;
      // The muxer rejects non-increasing dts across the source boundary.
      if (pkt->dts != AV_NOPTS_VALUE) {
        if (last_dts[slot] != AV_NOPTS_VALUE && pkt->dts <= last_dts[slot]) {
          pkt->dts = last_dts[slot] + 1;
        }
        if (pkt->pts != AV_NOPTS_VALUE && pkt->pts < pkt->dts) pkt->pts = pkt->dts;
        last_dts[slot] = pkt->dts;
      }
      pkt->stream_index = target->index;
      pkt->pos = -1;

      ret = av_interleaved_write_frame(out.get(), pkt.get());
      av_packet_unref(pkt.get());
      if (ret < 0) {
        discard_partial();
        if (context.ShouldAbort()) return MergeOutcome::Cancelled();
        return MergeOutcome::Failed(kMuxFailedCode, AvError(ret));
      }
    }

    SegmentTiming segment;
    segment.statement_index = job.sources[i].statement_index;
    segment.start_offset_ms = offset_ms;
    segment.end_offset_ms = offset_ms + in.duration_ms;
    result.segments.push_back(segment);
    offset_ms = segment.end_offset_ms;

    context.ReportProgress(static_cast<int32_t>((i + 1) * 95 / inputs.size()));
    std::ostringstream oss;
    oss << "[FFmpegConcatMerger] SOURCE_COPIED group=" << job.group_id
        << " statement=" << segment.statement_index
        << " start_ms=" << segment.start_offset_ms << " end_ms=" << segment.end_offset_ms;
    Logger::Debug(oss.str());
  }

  ret = av_write_trailer(out.get());
  if (ret < 0) {
    discard_partial();
    return MergeOutcome::Failed(kMuxFailedCode, AvError(ret));
  }
  out.reset();
  if (std::rename(temp_path.c_str(), final_path.c_str()) != 0) {
    (void)::unlink(temp_path.c_str());
    return MergeOutcome::Failed(kMuxFailedCode, "cannot finalize output");
  }

  result.output_locator = final_path;
  result.total_duration_ms = offset_ms;
  context.ReportProgress(100);
  {
    std::ostringstream oss;
    oss << "[FFmpegConcatMerger] MERGE_WRITTEN group=" << job.group_id
        << " sources=" << inputs.size() << " duration_ms=" << offset_ms;
    Logger::Info(oss.str());
  }
  return MergeOutcome::Succeeded(std::move(result));
}

}  // namespace triptych::merge

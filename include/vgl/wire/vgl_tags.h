/**
 * @file vgl_tags.h
 * @brief Virgil Commons - Tag bytes shared by both sides of the boundary
 *
 * Only the ordinal crosses the boundary, so these values must never be
 * renumbered. New variants are appended.
 */

#ifndef VGL_TAGS_H
#define VGL_TAGS_H

#ifdef __cplusplus
extern "C" {
#endif

typedef enum vgl_message_tag {
    VGL_MESSAGE_LOAD_MODEL = 0,
    VGL_MESSAGE_SET_WAKE_WORDS = 1,
    VGL_MESSAGE_UPDATE_AUDIO_DATA = 2,
    VGL_MESSAGE_DETECT_WAKE_WORDS = 3,
    VGL_MESSAGE_TRANSCRIBE = 4,
    VGL_MESSAGE_DEBUG = 5,
    VGL_MESSAGE_LISTEN = 6,
} vgl_message_tag_t;

typedef enum vgl_response_tag {
    VGL_RESPONSE_TEXT = 0,
    VGL_RESPONSE_WAKE_WORD_DETECTION = 1,
    VGL_RESPONSE_ERROR = 2,
} vgl_response_tag_t;

#ifdef __cplusplus
}
#endif

#endif  // VGL_TAGS_H

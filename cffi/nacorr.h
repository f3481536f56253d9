char* nacorr_strerror();

typedef void* CorrectionCache;
CorrectionCache nacorr_cache_new();
void nacorr_cache_free(CorrectionCache);
int nacorr_cache_size(CorrectionCache);

/* number of label states (N + 1) of a formula and tracer, -1 on error */
int nacorr_label_states(const char* formula, const char* tracer);

/* Functions below accept NULL for the cache and for the isotope selection
   ("H,O17:2" style, NULL means all isotopes) and return -1 on error. */

/* writes the (N + 1) x (N + 1) matrix in row-major order, returns N + 1 */
int nacorr_correction_matrix(CorrectionCache, const char* formula, const char* tracer,
                             const char* isotopes, double* out);

/* corrected and fractional_enrichment must have room for n values,
   n must equal N + 1 */
int nacorr_correct(CorrectionCache, const char* formula, const char* tracer,
                   const char* isotopes, int n, const double* observed,
                   double* corrected, double* fractional_enrichment, double* pool_total);
